/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "ConsoleSink.h"

#include <ctime>
#include <format>
#include <iostream>

namespace Courier::Core::Logging {

void ConsoleSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(_mutex);
    std::ostream& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;

    if (!_showMetadata) {
        out << entry.message << '\n';
        return;
    }

    const std::time_t t = std::chrono::system_clock::to_time_t(entry.timestamp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm);

    out << std::format("[{}] [{}] [{}] {}\n", stamp, toString(entry.level), entry.category, entry.message);
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(_mutex);
    std::cout.flush();
    std::cerr.flush();
}

} // namespace Courier::Core::Logging
