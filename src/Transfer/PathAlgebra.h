/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

/**
 * @file PathAlgebra.h
 * @brief Pure string operations on backend-relative paths
 *
 * Paths here are always '/'-separated and never touch a backend. Wildcard validation runs
 * before any enumeration so an invalid pattern costs zero backend calls.
 */

#pragma once

#include <string>
#include <string_view>

namespace Courier::Core::Transfer {

/**
 * @brief Suffix of path after prefix
 * @throws TransferError(PathMismatch) when path does not begin with prefix
 * @code
 * trimPrefix("data/a/b.txt", "data") == "/a/b.txt"
 * @endcode
 */
std::string trimPrefix(std::string_view path, std::string_view prefix);

// Strips trailing '/' from anything other than "/" itself
std::string stripTrailingSlashes(std::string_view path);

/**
 * @brief Rejects wildcards outside the final segment
 * @throws TransferError(InvalidGlob) naming the offending source
 */
void validateGlob(std::string_view pattern, std::string_view displayName = {});

// Everything before the final segment ("a/b/*.txt" -> "a/b", "*.txt" -> "")
std::string globRoot(std::string_view pattern);

// Joins a relative path onto a destination root; "/" roots do not double the separator
std::string joinPath(std::string_view root, std::string_view relative);

// Parent directory in the os.path.dirname sense ("a/b" -> "a", "/a" -> "/", "a" -> "")
std::string parentPath(std::string_view path);

// Final segment after trailing slashes are ignored ("a/b/" -> "b")
std::string finalSegment(std::string_view path);

// Relative path of an enumerated entry below root, without a leading separator
std::string relativeTo(std::string_view path, std::string_view root);

} // namespace Courier::Core::Transfer
