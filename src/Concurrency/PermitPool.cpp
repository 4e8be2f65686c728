/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "PermitPool.h"

namespace Courier {
namespace Core {
namespace Concurrency {

    PermitPool::PermitPool(size_t permits)
        : _capacity(permits == 0 ? 1 : permits)
        , _available(_capacity) {
    }

    PermitPool::Permit PermitPool::acquire() {
        std::unique_lock<std::mutex> lock(_mutex);
        _released.wait(lock, [this]() { return _available > 0; });
        --_available;
        return Permit(this);
    }

    PermitPool::Permit PermitPool::tryAcquire() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_available == 0) return Permit();
        --_available;
        return Permit(this);
    }

    size_t PermitPool::available() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _available;
    }

    void PermitPool::releaseOne() noexcept {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            ++_available;
        }
        _released.notify_one();
    }

} // namespace Concurrency
} // namespace Core
} // namespace Courier
