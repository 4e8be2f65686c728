/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "WorkContractGroup.h"
#include "IConcurrencyProvider.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include <exception>
#include <format>

namespace Courier {
namespace Core {
namespace Concurrency {

    WorkContractGroup::WorkContractGroup(size_t capacity, std::string name)
        : _capacity(capacity == 0 ? 1 : capacity)
        , _contracts(_capacity)
        , _name(std::move(name)) {
        // Free list is a stack; push in reverse so slot 0 is handed out first
        _freeList.reserve(_capacity);
        for (size_t i = _capacity; i > 0; --i) {
            _freeList.push_back(static_cast<uint32_t>(i - 1));
        }
    }

    WorkContractGroup::~WorkContractGroup() {
        // Stop accepting new selections, then let in-flight work finish
        stop();
        wait();

        IConcurrencyProvider* provider = nullptr;
        {
            std::unique_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
            provider = _concurrencyProvider;
            _concurrencyProvider = nullptr;
        }
        if (provider) {
            provider->notifyGroupDestroyed(this);
        }

        COURIER_DEBUG_BLOCK(
            if (_activeCount.load() != 0) {
                COURIER_LOG_DEBUG_CAT("WorkContractGroup",
                    std::format("Group '{}' destroyed with {} unexecuted contracts", _name, _activeCount.load()));
            }
        );
    }

    WorkContractHandle WorkContractGroup::createContract(std::function<void()> work) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_freeList.empty()) {
            return WorkContractHandle(); // No free slots available
        }
        uint32_t index = _freeList.back();
        _freeList.pop_back();

        auto& slot = _contracts[index];
        slot.work = std::move(work);
        slot.state = ContractState::Allocated;
        _activeCount.fetch_add(1, std::memory_order_acq_rel);
        return WorkContractHandle(this, index, slot.generation);
    }

    ScheduleResult WorkContractGroup::scheduleContract(const WorkContractHandle& handle) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!validateLocked(handle)) return ScheduleResult::Invalid;

            auto& slot = _contracts[handle.index()];
            if (slot.state == ContractState::Scheduled) return ScheduleResult::AlreadyScheduled;
            if (slot.state == ContractState::Executing) return ScheduleResult::Executing;
            if (slot.state != ContractState::Allocated) return ScheduleResult::Invalid;

            slot.state = ContractState::Scheduled;
            _ready.push_back(handle.index());
            _scheduledCount.fetch_add(1, std::memory_order_acq_rel);
        }

        // Notify concurrency provider if set
        std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        if (_concurrencyProvider) {
            _concurrencyProvider->notifyWorkAvailable(this);
        }
        return ScheduleResult::Scheduled;
    }

    ScheduleResult WorkContractGroup::unscheduleContract(const WorkContractHandle& handle) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!validateLocked(handle)) return ScheduleResult::Invalid;

        auto& slot = _contracts[handle.index()];
        if (slot.state == ContractState::Executing) return ScheduleResult::Executing;
        if (slot.state != ContractState::Scheduled) return ScheduleResult::NotScheduled;

        for (auto it = _ready.begin(); it != _ready.end(); ++it) {
            if (*it == handle.index()) {
                _ready.erase(it);
                break;
            }
        }
        slot.state = ContractState::Allocated;
        if (_scheduledCount.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            _waitCondition.notify_all();
        }
        return ScheduleResult::NotScheduled;
    }

    void WorkContractGroup::releaseContract(const WorkContractHandle& handle) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!validateLocked(handle)) return;

        auto& slot = _contracts[handle.index()];
        if (slot.state == ContractState::Executing) return;
        if (slot.state == ContractState::Scheduled) {
            for (auto it = _ready.begin(); it != _ready.end(); ++it) {
                if (*it == handle.index()) {
                    _ready.erase(it);
                    break;
                }
            }
            _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
        }
        freeSlotLocked(handle.index());
        _activeCount.fetch_sub(1, std::memory_order_acq_rel);
        _waitCondition.notify_all();
    }

    bool WorkContractGroup::isValidHandle(const WorkContractHandle& handle) const noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        return validateLocked(handle);
    }

    ContractState WorkContractGroup::getContractState(const WorkContractHandle& handle) const noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!validateLocked(handle)) return ContractState::Free;
        return _contracts[handle.index()].state;
    }

    WorkContractHandle WorkContractGroup::selectForExecution() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping.load(std::memory_order_acquire) || _ready.empty()) {
            return WorkContractHandle();
        }
        uint32_t index = _ready.front();
        _ready.pop_front();

        auto& slot = _contracts[index];
        slot.state = ContractState::Executing;
        _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
        _executingCount.fetch_add(1, std::memory_order_acq_rel);
        return WorkContractHandle(this, index, slot.generation);
    }

    void WorkContractGroup::executeContract(const WorkContractHandle& handle) {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!validateLocked(handle) || _contracts[handle.index()].state != ContractState::Executing) {
                return;
            }
            // Move work out (point of no return), free the slot before running to allow re-entrance
            task = std::move(_contracts[handle.index()].work);
            freeSlotLocked(handle.index());
        }

        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                COURIER_LOG_ERROR_CAT("WorkContractGroup",
                    std::format("Contract in group '{}' threw: {}", _name, e.what()));
            } catch (...) {
                COURIER_LOG_ERROR_CAT("WorkContractGroup",
                    std::format("Contract in group '{}' threw a non-standard exception", _name));
            }
        }

        // Notify while holding the lock: once it is released the owner may destroy the group
        std::lock_guard<std::mutex> lock(_mutex);
        _activeCount.fetch_sub(1, std::memory_order_acq_rel);
        _executingCount.fetch_sub(1, std::memory_order_acq_rel);
        _waitCondition.notify_all();
    }

    size_t WorkContractGroup::executeAllBackgroundWork() {
        size_t executed = 0;
        while (true) {
            WorkContractHandle handle = selectForExecution();
            if (!handle.valid()) {
                break;  // No more scheduled contracts
            }
            executeContract(handle);
            ++executed;
        }
        return executed;
    }

    void WorkContractGroup::wait() {
        std::unique_lock<std::mutex> lock(_mutex);
        _waitCondition.wait(lock, [this]() {
            if (_stopping.load(std::memory_order_acquire)) {
                // When stopping, scheduled work will never be selected; only wait for executing work
                return _executingCount.load(std::memory_order_acquire) == 0;
            }
            return _scheduledCount.load(std::memory_order_acquire) == 0 &&
                   _executingCount.load(std::memory_order_acquire) == 0;
        });
    }

    void WorkContractGroup::waitForCapacity() {
        std::unique_lock<std::mutex> lock(_mutex);
        _waitCondition.wait(lock, [this]() {
            return !_freeList.empty() || _stopping.load(std::memory_order_acquire);
        });
    }

    void WorkContractGroup::stop() {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping.store(true, std::memory_order_release);
        _waitCondition.notify_all();
    }

    void WorkContractGroup::resume() {
        _stopping.store(false, std::memory_order_release);
    }

    void WorkContractGroup::setConcurrencyProvider(IConcurrencyProvider* provider) {
        std::unique_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        _concurrencyProvider = provider;
    }

    IConcurrencyProvider* WorkContractGroup::getConcurrencyProvider() const {
        std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        return _concurrencyProvider;
    }

    bool WorkContractGroup::validateLocked(const WorkContractHandle& handle) const noexcept {
        if (handle.owner() != this) return false;
        if (handle.index() >= _capacity) return false;
        const auto& slot = _contracts[handle.index()];
        return slot.state != ContractState::Free && slot.generation == handle.generation();
    }

    void WorkContractGroup::freeSlotLocked(uint32_t index) {
        auto& slot = _contracts[index];
        slot.work = nullptr;
        slot.state = ContractState::Free;
        ++slot.generation;
        _freeList.push_back(index);
    }

} // namespace Concurrency
} // namespace Core
} // namespace Courier
