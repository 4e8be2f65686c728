/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace Courier {
namespace Core {
namespace Concurrency {

    /**
     * @brief Counting semaphore bounding how many transfers stream data at once
     *
     * One pool is shared by every transfer of a process (or of a test). acquire() blocks until a
     * permit is free and returns a Permit that gives it back when destroyed, so a permit is
     * released on every exit path of the data phase.
     *
     * @code
     * PermitPool pool(32);
     * {
     *     auto permit = pool.acquire();
     *     copyBytes();
     * } // released here, even if copyBytes() throws
     * @endcode
     */
    class PermitPool {
    public:
        class Permit {
        public:
            Permit() = default;
            ~Permit() { release(); }

            Permit(Permit&& other) noexcept : _pool(other._pool) { other._pool = nullptr; }
            Permit& operator=(Permit&& other) noexcept {
                if (this != &other) {
                    release();
                    _pool = other._pool;
                    other._pool = nullptr;
                }
                return *this;
            }
            Permit(const Permit&) = delete;
            Permit& operator=(const Permit&) = delete;

            bool held() const noexcept { return _pool != nullptr; }

            void release() noexcept {
                if (_pool) {
                    _pool->releaseOne();
                    _pool = nullptr;
                }
            }

        private:
            friend class PermitPool;
            explicit Permit(PermitPool* pool) : _pool(pool) {}
            PermitPool* _pool = nullptr;
        };

        explicit PermitPool(size_t permits);

        PermitPool(const PermitPool&) = delete;
        PermitPool& operator=(const PermitPool&) = delete;

        Permit acquire();
        Permit tryAcquire();

        size_t available() const;
        size_t capacity() const noexcept { return _capacity; }

    private:
        void releaseOne() noexcept;

        const size_t _capacity;
        size_t _available;
        mutable std::mutex _mutex;
        std::condition_variable _released;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Courier
