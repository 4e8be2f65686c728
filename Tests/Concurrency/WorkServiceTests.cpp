/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include "../../src/Concurrency/WorkService.h"
#include "../../src/Concurrency/WorkContractGroup.h"

using namespace Courier::Core::Concurrency;

TEST_CASE("WorkContractGroup lifetime semantics with WorkService", "[concurrency][lifetime]") {
    SECTION("Stack-allocated group is removed by its destructor") {
        WorkService service{WorkService::Config{2, 8}};
        service.start();
        {
            WorkContractGroup group(32);
            auto status = service.addWorkContractGroup(&group);
            REQUIRE(status == WorkService::GroupOperationStatus::Added);
            REQUIRE(service.getWorkContractGroupCount() == 1);

            auto h = group.createContract([]{});
            if (h.valid()) h.schedule();
        }
        REQUIRE(service.getWorkContractGroupCount() == 0);
        service.stop();
    }

    SECTION("Explicit removal before delete") {
        WorkService service{WorkService::Config{2, 8}};
        service.start();
        auto* group = new WorkContractGroup(32);
        REQUIRE(service.addWorkContractGroup(group) == WorkService::GroupOperationStatus::Added);
        REQUIRE(service.addWorkContractGroup(group) == WorkService::GroupOperationStatus::Exists);

        REQUIRE(service.removeWorkContractGroup(group) == WorkService::GroupOperationStatus::Removed);
        REQUIRE(service.removeWorkContractGroup(group) == WorkService::GroupOperationStatus::NotFound);
        REQUIRE(group->getConcurrencyProvider() == nullptr);

        delete group;
        service.stop();
    }

    SECTION("clear() disconnects every group") {
        WorkService service{WorkService::Config{1, 8}};
        service.start();
        WorkContractGroup a(8), b(8);
        service.addWorkContractGroup(&a);
        service.addWorkContractGroup(&b);

        service.clear();
        REQUIRE(service.getWorkContractGroupCount() == 0);
        REQUIRE(a.getConcurrencyProvider() == nullptr);
        REQUIRE(b.getConcurrencyProvider() == nullptr);
        service.stop();
    }

    SECTION("Group limit is enforced") {
        WorkService service{WorkService::Config{1, 1}};
        WorkContractGroup a(4), b(4);
        REQUIRE(service.addWorkContractGroup(&a) == WorkService::GroupOperationStatus::Added);
        REQUIRE(service.addWorkContractGroup(&b) == WorkService::GroupOperationStatus::OutOfSpace);
        service.removeWorkContractGroup(&a);
    }
}

TEST_CASE("WorkService workers drain scheduled contracts", "[concurrency][service]") {
    WorkService service{WorkService::Config{4, 8}};
    service.start();
    REQUIRE(service.isRunning());
    REQUIRE(service.getThreadCount() == 4);

    WorkContractGroup group(64, "Drain");
    service.addWorkContractGroup(&group);

    std::atomic<int> executed{0};
    const int N = 200;
    for (int i = 0; i < N; ++i) {
        auto h = group.createContract([&executed] { executed.fetch_add(1, std::memory_order_relaxed); });
        while (!h.valid()) {
            group.waitForCapacity();
            h = group.createContract([&executed] { executed.fetch_add(1, std::memory_order_relaxed); });
        }
        REQUIRE(h.schedule() == ScheduleResult::Scheduled);
    }

    group.wait();
    REQUIRE(executed.load() == N);
    REQUIRE(group.activeCount() == 0);

    service.removeWorkContractGroup(&group);
    service.stop();
    REQUIRE_FALSE(service.isRunning());
}

TEST_CASE("Stopped group ignores scheduled work", "[concurrency][stop]") {
    WorkContractGroup group(4, "Stopped");
    bool ran = false;
    auto h = group.createContract([&ran] { ran = true; });
    h.schedule();

    group.stop();
    REQUIRE(group.isStopping());
    REQUIRE(group.executeAllBackgroundWork() == 0);
    group.wait();
    REQUIRE_FALSE(ran);

    group.resume();
    REQUIRE(group.executeAllBackgroundWork() == 1);
    REQUIRE(ran);
}
