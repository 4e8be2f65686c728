/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace Courier::Core::Transfer {

/**
 * @brief Tunables shared by every transfer component
 *
 * Defaults suit interactive use. fromEnvironment() overlays COURIER_CHUNK_SIZE,
 * COURIER_MAX_CONCURRENT_COPIES and COURIER_WORKER_THREADS; the CLI overlays its flags last.
 */
struct TransferConfig {
    size_t chunkSize;                 // Bytes per read/write call while streaming
    size_t maxConcurrentCopies;       // Process-wide in-flight transfer bound (permit count)
    uint64_t largeObjectThreshold;    // Size at which deduplication hints are requested
    uint32_t workerThreads;           // WorkService threads; 0 = hardware concurrency
    size_t contractCapacity;          // Contract slots per expansion group
    std::string attributesMarker;     // Final segment never written by a generic copy

    TransferConfig()
        : chunkSize(16 * 1024 * 1024)
        , maxConcurrentCopies(32)
        , largeObjectThreshold(50000000)
        , workerThreads(0)
        , contractCapacity(1024)
        , attributesMarker(".gitattributes") {}

    static TransferConfig fromEnvironment();
};

} // namespace Courier::Core::Transfer
