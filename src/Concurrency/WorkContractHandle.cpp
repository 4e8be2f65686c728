/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "WorkContractHandle.h"
#include "WorkContractGroup.h"

namespace Courier {
namespace Core {
namespace Concurrency {

    ScheduleResult WorkContractHandle::schedule() {
        if (!_owner) return ScheduleResult::Invalid;
        return _owner->scheduleContract(*this);
    }

    ScheduleResult WorkContractHandle::unschedule() {
        if (!_owner) return ScheduleResult::Invalid;
        return _owner->unscheduleContract(*this);
    }

    bool WorkContractHandle::valid() const {
        return _owner && _owner->isValidHandle(*this);
    }

    void WorkContractHandle::release() {
        if (_owner) _owner->releaseContract(*this);
    }

    bool WorkContractHandle::isScheduled() const {
        return _owner && _owner->getContractState(*this) == ContractState::Scheduled;
    }

    bool WorkContractHandle::isExecuting() const {
        return _owner && _owner->getContractState(*this) == ContractState::Executing;
    }

} // namespace Concurrency
} // namespace Core
} // namespace Courier
