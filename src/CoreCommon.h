/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Core common utilities and debugging macros for Courier
 *
 * Debug assertions, build configuration flags, and the environment accessors used by
 * configuration overlays (see Transfer/TransferConfig.h).
 */

#include <cassert>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#ifdef CourierDebug
#define COURIER_DEBUG_BLOCK(code) do { code } while(0)
#undef NDEBUG
#define COURIER_ASSERT(condition, message) assert(condition)
#else
#define COURIER_DEBUG_BLOCK(code) ((void)0)
#define COURIER_ASSERT(condition, message) ((void)0)
#endif

namespace Courier {
namespace Core {
    // Cross-platform safe environment variable getter that avoids returning raw pointers
    // and copies into std::string. Returns std::nullopt if the variable is not set.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
#if defined(_WIN32)
        size_t required = 0;
        errno_t err = getenv_s(&required, nullptr, 0, name);
        if (err != 0 || required == 0) return std::nullopt;
        std::string value;
        value.resize(required);
        size_t read = 0;
        err = getenv_s(&read, value.data(), value.size(), name);
        if (err != 0 || read == 0) return std::nullopt;
        if (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
#else
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
#endif
    }

    // Parses an unsigned decimal value; returns std::nullopt for empty, signed or trailing-garbage input
    inline std::optional<size_t> parseUnsigned(std::string_view text) {
        if (text.empty()) return std::nullopt;
        size_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
        return value;
    }
} // namespace Core
}
