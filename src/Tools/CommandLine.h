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
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../Transfer/TransferConfig.h"
#include "../Transfer/TransferCoordinator.h"

namespace Courier::Tools {

enum class CommandKind { Help, Copy, Move, Remove, Info, Duplicate, Login, Mount };

struct CommandLine {
    CommandKind kind = CommandKind::Help;
    std::string name;
    std::vector<std::string> paths;
    bool recursive = false;
    std::optional<std::string> message;
    Core::Transfer::Visibility visibility = Core::Transfer::Visibility::Unchanged;
    bool verbose = false;

    // Overrides applied on top of TransferConfig::fromEnvironment()
    std::optional<size_t> chunkSize;
    std::optional<size_t> maxConcurrent;
    std::optional<uint32_t> threads;

    void applyTo(Core::Transfer::TransferConfig& config) const;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Parses `courier <command> [options] args...`
 * @throws UsageError for unknown commands, bad options or wrong argument counts
 */
CommandLine parseCommandLine(int argc, const char* const argv[]);

std::string usageText();

} // namespace Courier::Tools
