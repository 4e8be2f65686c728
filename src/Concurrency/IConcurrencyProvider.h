/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

namespace Courier {
namespace Core {
namespace Concurrency {

class WorkContractGroup;

/**
 * @brief Receives notifications from WorkContractGroups it executes
 *
 * WorkService implements this to wake idle workers when a group schedules work and to drop a
 * group that is being destroyed without having been removed first.
 */
class IConcurrencyProvider {
public:
    virtual ~IConcurrencyProvider() = default;

    virtual void notifyWorkAvailable(WorkContractGroup* group) = 0;
    virtual void notifyGroupDestroyed(WorkContractGroup* group) = 0;
};

}  // namespace Concurrency
}  // namespace Core
}  // namespace Courier
