/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

/**
 * @file WorkService.h
 * @brief Worker threads that execute contracts from registered WorkContractGroups
 *
 * Groups are registered with addWorkContractGroup() and picked round-robin by idle workers.
 * The service does not own groups; a group destroyed while still registered removes itself
 * through IConcurrencyProvider::notifyGroupDestroyed().
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

#include "IConcurrencyProvider.h"

namespace Courier {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    class WorkService : public IConcurrencyProvider {
    public:
        struct Config {
            uint32_t threadCount = 0;   ///< 0 => std::thread::hardware_concurrency()
            size_t maxGroups = 4096;
        };

        enum class GroupOperationStatus {
            Added,
            Removed,
            Exists,
            NotFound,
            OutOfSpace
        };

        explicit WorkService(Config config);
        ~WorkService() override;

        WorkService(const WorkService&) = delete;
        WorkService& operator=(const WorkService&) = delete;

        void start();
        void stop();
        bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

        GroupOperationStatus addWorkContractGroup(WorkContractGroup* group);
        GroupOperationStatus removeWorkContractGroup(WorkContractGroup* group);
        size_t getWorkContractGroupCount() const;
        void clear();

        size_t getThreadCount() const noexcept { return _threadCount; }

        // IConcurrencyProvider
        void notifyWorkAvailable(WorkContractGroup* group) override;
        void notifyGroupDestroyed(WorkContractGroup* group) override;

    private:
        void workerLoop();
        bool eraseGroupLocked(WorkContractGroup* group);

        Config _config;
        size_t _threadCount;
        std::vector<std::thread> _threads;
        std::vector<WorkContractGroup*> _groups;
        size_t _nextGroup = 0;
        uint64_t _workEpoch = 0;

        mutable std::mutex _mutex;
        std::condition_variable _workAvailable;
        std::atomic<bool> _running{false};
    };

} // namespace Concurrency
} // namespace Core
} // namespace Courier
