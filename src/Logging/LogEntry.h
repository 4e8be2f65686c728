/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>

#include "LogLevel.h"

namespace Courier::Core::Logging {

// One formatted record as handed to every sink
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::Info;
    std::string category;
    std::string message;
    std::thread::id threadId;
};

} // namespace Courier::Core::Logging
