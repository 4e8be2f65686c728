/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

/**
 * @file WorkContractHandle.h
 * @brief Stamped handle for scheduling and managing work contracts
 *
 * A WorkContractHandle carries (owner + index + generation) as stamped by WorkContractGroup.
 * The group is the source of truth; a handle whose generation no longer matches its slot is
 * invalid, which prevents a stale handle from touching a recycled slot.
 */

#pragma once

#include <cstdint>

namespace Courier
{
namespace Core
{
namespace Concurrency
{

class WorkContractGroup;

/**
 * @brief States that a work contract can be in during its lifecycle
 */
enum class ContractState : uint32_t
{
    Free = 0,       ///< Contract slot is available for allocation
    Allocated = 1,  ///< Contract has been allocated but not scheduled
    Scheduled = 2,  ///< Contract is scheduled and ready for execution
    Executing = 3   ///< Contract is currently being executed
};

/**
 * @brief Result of schedule/unschedule operations
 */
enum class ScheduleResult
{
    Scheduled,         ///< Contract is now scheduled (successful schedule operation)
    AlreadyScheduled,  ///< Contract was already scheduled (schedule operation failed)
    NotScheduled,      ///< Contract is not scheduled (successful unschedule operation)
    Executing,         ///< Cannot modify - currently executing
    Invalid            ///< Invalid handle provided
};

/**
 * @class WorkContractHandle
 * @brief Value handle for a contract slot
 *
 * Typical workflow:
 * 1. Create via WorkContractGroup::createContract()
 * 2. Call schedule(), optionally unschedule()
 * 3. After execution starts or release(), valid() becomes false
 *
 * @code
 * WorkContractGroup group(1024);
 * auto h = group.createContract([]{ doWork(); });
 * if (h.schedule() == ScheduleResult::Scheduled) { // queued }
 * @endcode
 */
class WorkContractHandle
{
private:
    friend class WorkContractGroup;

    WorkContractHandle(WorkContractGroup* group, uint32_t index, uint32_t generation)
        : _owner(group), _index(index), _generation(generation) {}

public:
    // Default: invalid (no stamped identity)
    WorkContractHandle() = default;

    /**
     * @brief Schedules this contract for execution
     *
     * Transitions Allocated -> Scheduled. No-op if already scheduled.
     * @return Scheduled, AlreadyScheduled, Executing, or Invalid
     */
    ScheduleResult schedule();

    /**
     * @brief Attempts to remove this contract from the ready set
     * @return NotScheduled on success, Executing if too late, or Invalid
     */
    ScheduleResult unschedule();

    /**
     * @brief Checks whether this handle still refers to a live slot
     */
    bool valid() const;

    /**
     * @brief Immediately frees this contract's slot without running it
     */
    void release();

    bool isScheduled() const;
    bool isExecuting() const;

    WorkContractGroup* owner() const noexcept { return _owner; }
    uint32_t index() const noexcept { return _index; }
    uint32_t generation() const noexcept { return _generation; }

private:
    WorkContractGroup* _owner = nullptr;
    uint32_t _index = 0;
    uint32_t _generation = 0;
};

}  // namespace Concurrency
}  // namespace Core
}  // namespace Courier
