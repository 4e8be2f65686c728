/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger fanning records out to pluggable sinks
 *
 * Logger::global() starts with a single ConsoleSink. Components log through the
 * COURIER_LOG_* macros; the _CAT variants take an explicit category, the plain ones use the
 * calling function's name. Records below the logger's minimum level are dropped before any
 * formatting or sink dispatch.
 *
 * @code
 * COURIER_LOG_INFO_CAT("Transfer", "Copying " + src + " to " + dst + "...");
 * COURIER_LOG_ERROR("Failed to open " + path);
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogLevel.h"

namespace Courier::Core::Logging {

class Logger {
public:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& global();

    void log(LogLevel level, std::string_view category, std::string_view message);

    void trace(std::string_view category, std::string_view message) { log(LogLevel::Trace, category, message); }
    void debug(std::string_view category, std::string_view message) { log(LogLevel::Debug, category, message); }
    void info(std::string_view category, std::string_view message) { log(LogLevel::Info, category, message); }
    void warning(std::string_view category, std::string_view message) { log(LogLevel::Warning, category, message); }
    void error(std::string_view category, std::string_view message) { log(LogLevel::Error, category, message); }
    void fatal(std::string_view category, std::string_view message) { log(LogLevel::Fatal, category, message); }

    void addSink(std::shared_ptr<ILogSink> sink);
    bool removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();
    size_t sinkCount() const;

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
    bool isEnabled(LogLevel level) const noexcept { return level >= minLevel(); }

    void flush();

private:
    mutable std::shared_mutex _sinkMutex;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
    std::atomic<LogLevel> _minLevel{LogLevel::Info};
};

} // namespace Courier::Core::Logging

#define COURIER_LOG_AT(level, cat, msg)                                                           \
    do {                                                                                          \
        auto& courierLogger_ = ::Courier::Core::Logging::Logger::global();                        \
        if (courierLogger_.isEnabled(level)) courierLogger_.log((level), (cat), (msg));           \
    } while (0)

#define COURIER_LOG_TRACE(msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Trace, __func__, msg)
#define COURIER_LOG_DEBUG(msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Debug, __func__, msg)
#define COURIER_LOG_INFO(msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Info, __func__, msg)
#define COURIER_LOG_WARNING(msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Warning, __func__, msg)
#define COURIER_LOG_ERROR(msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Error, __func__, msg)
#define COURIER_LOG_FATAL(msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Fatal, __func__, msg)

#define COURIER_LOG_TRACE_CAT(cat, msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Trace, cat, msg)
#define COURIER_LOG_DEBUG_CAT(cat, msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Debug, cat, msg)
#define COURIER_LOG_INFO_CAT(cat, msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Info, cat, msg)
#define COURIER_LOG_WARNING_CAT(cat, msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Warning, cat, msg)
#define COURIER_LOG_ERROR_CAT(cat, msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Error, cat, msg)
#define COURIER_LOG_FATAL_CAT(cat, msg) COURIER_LOG_AT(::Courier::Core::Logging::LogLevel::Fatal, cat, msg)
