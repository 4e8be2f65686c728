/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

/**
 * @file WorkContractGroup.h
 * @brief Fixed-capacity pool of work contracts
 *
 * A WorkContractGroup owns a fixed number of contract slots. Callers create contracts from
 * callables, schedule them, and either let a WorkService execute them on its worker threads or
 * drain them on the calling thread with executeAllBackgroundWork(). wait() blocks until every
 * scheduled and executing contract has finished.
 *
 * Draining on the calling thread is what makes nested fan-out safe: a contract running on a
 * worker may create its own group, schedule into it and then drain it, so it never blocks on
 * a worker that is itself waiting.
 *
 * @code
 * WorkContractGroup group(256, "Walker");
 * service.addWorkContractGroup(&group);
 * for (auto& item : items) group.createContract([item]{ process(item); }).schedule();
 * group.executeAllBackgroundWork();
 * group.wait();
 * service.removeWorkContractGroup(&group);
 * @endcode
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "WorkContractHandle.h"

namespace Courier {
namespace Core {
namespace Concurrency {

    class IConcurrencyProvider;

    class WorkContractGroup {
    public:
        explicit WorkContractGroup(size_t capacity, std::string name = "WorkContractGroup");
        ~WorkContractGroup();

        WorkContractGroup(const WorkContractGroup&) = delete;
        WorkContractGroup& operator=(const WorkContractGroup&) = delete;

        /**
         * @brief Allocates a contract slot for the given work
         * @return Valid handle, or an invalid handle when every slot is in use
         */
        WorkContractHandle createContract(std::function<void()> work);

        ScheduleResult scheduleContract(const WorkContractHandle& handle);
        ScheduleResult unscheduleContract(const WorkContractHandle& handle);
        void releaseContract(const WorkContractHandle& handle);
        bool isValidHandle(const WorkContractHandle& handle) const noexcept;
        ContractState getContractState(const WorkContractHandle& handle) const noexcept;

        /**
         * @brief Takes the oldest scheduled contract and marks it executing
         * @return Invalid handle if nothing is scheduled or the group is stopping
         */
        WorkContractHandle selectForExecution();

        /**
         * @brief Runs a contract previously returned by selectForExecution()
         *
         * The slot is returned to the free list before the work runs. The group is not touched
         * after the executing count is released, so an owner blocked in wait() may destroy the
         * group as soon as it wakes.
         */
        void executeContract(const WorkContractHandle& handle);

        /**
         * @brief Executes scheduled contracts on the calling thread until none remain
         * @return Number of contracts executed
         */
        size_t executeAllBackgroundWork();

        // Blocks until scheduled and executing counts both reach zero
        void wait();

        // Blocks until at least one slot is free
        void waitForCapacity();

        void stop();
        void resume();
        bool isStopping() const noexcept { return _stopping.load(std::memory_order_acquire); }

        size_t capacity() const noexcept { return _capacity; }
        size_t activeCount() const noexcept { return _activeCount.load(std::memory_order_acquire); }
        size_t scheduledCount() const noexcept { return _scheduledCount.load(std::memory_order_acquire); }
        size_t executingCount() const noexcept { return _executingCount.load(std::memory_order_acquire); }
        const std::string& name() const noexcept { return _name; }

        void setConcurrencyProvider(IConcurrencyProvider* provider);
        IConcurrencyProvider* getConcurrencyProvider() const;

    private:
        static constexpr uint32_t INVALID_INDEX = ~0u;

        struct ContractSlot {
            std::function<void()> work;
            uint32_t generation = 0;
            ContractState state = ContractState::Free;
        };

        bool validateLocked(const WorkContractHandle& handle) const noexcept;
        void freeSlotLocked(uint32_t index);

        const size_t _capacity;
        std::vector<ContractSlot> _contracts;
        std::vector<uint32_t> _freeList;
        std::deque<uint32_t> _ready;

        std::atomic<size_t> _activeCount{0};
        std::atomic<size_t> _scheduledCount{0};
        std::atomic<size_t> _executingCount{0};

        mutable std::mutex _mutex;
        std::condition_variable _waitCondition;

        std::string _name;
        IConcurrencyProvider* _concurrencyProvider = nullptr;
        mutable std::shared_mutex _concurrencyProviderMutex;
        std::atomic<bool> _stopping{false};
    };

} // namespace Concurrency
} // namespace Core
} // namespace Courier
