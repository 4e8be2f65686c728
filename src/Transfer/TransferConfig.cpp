/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "TransferConfig.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include <format>
#include <limits>

namespace Courier::Core::Transfer {

namespace {
    // Reads a positive integer override; logs and ignores anything else
    std::optional<size_t> positiveFromEnv(const char* name) {
        auto raw = safeGetEnv(name);
        if (!raw) return std::nullopt;
        auto value = parseUnsigned(*raw);
        if (!value || *value == 0) {
            COURIER_LOG_WARNING_CAT("Config", std::format("Ignoring {}='{}': expected a positive integer", name, *raw));
            return std::nullopt;
        }
        return value;
    }
}

TransferConfig TransferConfig::fromEnvironment() {
    TransferConfig config;
    if (auto v = positiveFromEnv("COURIER_CHUNK_SIZE")) {
        config.chunkSize = *v;
    }
    if (auto v = positiveFromEnv("COURIER_MAX_CONCURRENT_COPIES")) {
        config.maxConcurrentCopies = *v;
    }
    if (auto v = positiveFromEnv("COURIER_WORKER_THREADS")) {
        if (*v > std::numeric_limits<uint32_t>::max()) {
            COURIER_LOG_WARNING_CAT("Config", "Ignoring COURIER_WORKER_THREADS: value out of range");
        } else {
            config.workerThreads = static_cast<uint32_t>(*v);
        }
    }
    return config;
}

} // namespace Courier::Core::Transfer
