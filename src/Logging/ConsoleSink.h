/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

#include <mutex>

#include "ILogSink.h"

namespace Courier::Core::Logging {

/**
 * @brief Writes records to the terminal
 *
 * Info and below go to stdout, Warning and above go to stderr. With showMetadata enabled each
 * line is prefixed with time, level and category; otherwise only the message is printed, which
 * is what the command line tool uses for progress output.
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool showMetadata = true) : _showMetadata(showMetadata) {}

    void write(const LogEntry& entry) override;
    void flush() override;

    void setShowMetadata(bool show) {
        std::lock_guard<std::mutex> lock(_mutex);
        _showMetadata = show;
    }

private:
    std::mutex _mutex;
    bool _showMetadata;
};

} // namespace Courier::Core::Logging
