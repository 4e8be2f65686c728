/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "Logger.h"

#include <algorithm>
#include <mutex>

#include "ConsoleSink.h"

namespace Courier::Core::Logging {

Logger::Logger() {
    _sinks.push_back(std::make_shared<ConsoleSink>());
}

Logger& Logger::global() {
    static Logger instance;
    return instance;
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (!isEnabled(level)) return;

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.category = std::string(category);
    entry.message = std::string(message);
    entry.threadId = std::this_thread::get_id();

    std::shared_lock<std::shared_mutex> lock(_sinkMutex);
    for (const auto& sink : _sinks) {
        if (sink->accepts(level)) {
            sink->write(entry);
        }
    }
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::unique_lock<std::shared_mutex> lock(_sinkMutex);
    _sinks.push_back(std::move(sink));
}

bool Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::unique_lock<std::shared_mutex> lock(_sinkMutex);
    auto it = std::find(_sinks.begin(), _sinks.end(), sink);
    if (it == _sinks.end()) return false;
    _sinks.erase(it);
    return true;
}

void Logger::clearSinks() {
    std::unique_lock<std::shared_mutex> lock(_sinkMutex);
    _sinks.clear();
}

size_t Logger::sinkCount() const {
    std::shared_lock<std::shared_mutex> lock(_sinkMutex);
    return _sinks.size();
}

void Logger::flush() {
    std::shared_lock<std::shared_mutex> lock(_sinkMutex);
    for (const auto& sink : _sinks) {
        sink->flush();
    }
}

} // namespace Courier::Core::Logging
