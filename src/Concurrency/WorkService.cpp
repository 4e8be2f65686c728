/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "WorkService.h"
#include "WorkContractGroup.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <format>

namespace Courier {
namespace Core {
namespace Concurrency {

    WorkService::WorkService(Config config)
        : _config(config)
        , _threadCount(config.threadCount != 0 ? config.threadCount
                                                : std::max(1u, std::thread::hardware_concurrency())) {
    }

    WorkService::~WorkService() {
        stop();
        clear();
    }

    void WorkService::start() {
        if (_running.exchange(true, std::memory_order_acq_rel)) return;

        _threads.reserve(_threadCount);
        for (size_t i = 0; i < _threadCount; ++i) {
            _threads.emplace_back([this]() { workerLoop(); });
        }
        COURIER_LOG_DEBUG_CAT("WorkService", std::format("Started {} worker threads", _threadCount));
    }

    void WorkService::stop() {
        if (!_running.exchange(false, std::memory_order_acq_rel)) return;

        {
            std::lock_guard<std::mutex> lock(_mutex);
            ++_workEpoch;
        }
        _workAvailable.notify_all();
        for (auto& t : _threads) {
            if (t.joinable()) t.join();
        }
        _threads.clear();
    }

    WorkService::GroupOperationStatus WorkService::addWorkContractGroup(WorkContractGroup* group) {
        if (!group) return GroupOperationStatus::NotFound;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (std::find(_groups.begin(), _groups.end(), group) != _groups.end()) {
                return GroupOperationStatus::Exists;
            }
            if (_groups.size() >= _config.maxGroups) {
                return GroupOperationStatus::OutOfSpace;
            }
            _groups.push_back(group);
            ++_workEpoch;
        }
        group->setConcurrencyProvider(this);
        _workAvailable.notify_all();
        return GroupOperationStatus::Added;
    }

    WorkService::GroupOperationStatus WorkService::removeWorkContractGroup(WorkContractGroup* group) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!eraseGroupLocked(group)) return GroupOperationStatus::NotFound;
        }
        group->setConcurrencyProvider(nullptr);
        return GroupOperationStatus::Removed;
    }

    size_t WorkService::getWorkContractGroupCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _groups.size();
    }

    void WorkService::clear() {
        std::vector<WorkContractGroup*> groups;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            groups.swap(_groups);
            _nextGroup = 0;
        }
        for (auto* g : groups) {
            g->setConcurrencyProvider(nullptr);
        }
    }

    void WorkService::notifyWorkAvailable(WorkContractGroup* /*group*/) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            ++_workEpoch;
        }
        _workAvailable.notify_one();
    }

    void WorkService::notifyGroupDestroyed(WorkContractGroup* group) {
        std::lock_guard<std::mutex> lock(_mutex);
        eraseGroupLocked(group);
    }

    bool WorkService::eraseGroupLocked(WorkContractGroup* group) {
        auto it = std::find(_groups.begin(), _groups.end(), group);
        if (it == _groups.end()) return false;
        _groups.erase(it);
        if (_nextGroup >= _groups.size()) _nextGroup = 0;
        return true;
    }

    void WorkService::workerLoop() {
        std::unique_lock<std::mutex> lock(_mutex);
        while (_running.load(std::memory_order_acquire)) {
            // Selection happens under the service lock so a group cannot be removed between
            // being picked and having its executing count raised
            WorkContractGroup* picked = nullptr;
            WorkContractHandle handle;
            for (size_t n = 0; n < _groups.size(); ++n) {
                WorkContractGroup* g = _groups[(_nextGroup + n) % _groups.size()];
                handle = g->selectForExecution();
                if (handle.valid()) {
                    picked = g;
                    _nextGroup = (_nextGroup + n + 1) % _groups.size();
                    break;
                }
            }

            if (picked) {
                lock.unlock();
                picked->executeContract(handle);
                lock.lock();
                continue;
            }

            const uint64_t seen = _workEpoch;
            _workAvailable.wait(lock, [this, seen]() {
                return !_running.load(std::memory_order_acquire) || _workEpoch != seen;
            });
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace Courier
