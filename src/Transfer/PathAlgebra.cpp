/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "PathAlgebra.h"
#include "TransferError.h"
#include "../VirtualFileSystem/GlobMatch.h"
#include <format>

namespace Courier::Core::Transfer {

std::string trimPrefix(std::string_view path, std::string_view prefix) {
    if (path.size() < prefix.size() || path.substr(0, prefix.size()) != prefix) {
        throw TransferError(TransferErrc::PathMismatch,
                            std::format("Path {} not in directory {}", path, prefix));
    }
    return std::string(path.substr(prefix.size()));
}

std::string stripTrailingSlashes(std::string_view path) {
    if (path == "/") return std::string(path);
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    return std::string(path);
}

void validateGlob(std::string_view pattern, std::string_view displayName) {
    if (IO::hasWildcard(globRoot(pattern))) {
        throw TransferError(TransferErrc::InvalidGlob,
                            std::format("Invalid glob {}. Wildcards can only appear in the last position",
                                        displayName.empty() ? pattern : displayName));
    }
}

std::string globRoot(std::string_view pattern) {
    auto slash = pattern.rfind('/');
    if (slash == std::string_view::npos) return {};
    return std::string(pattern.substr(0, slash));
}

std::string joinPath(std::string_view root, std::string_view relative) {
    if (root == "/") return "/" + std::string(relative);
    return std::string(root) + "/" + std::string(relative);
}

std::string parentPath(std::string_view path) {
    auto slash = path.rfind('/');
    if (slash == std::string_view::npos) return {};
    auto head = path.substr(0, slash);
    // A run of leading separators is the root itself
    if (head.find_first_not_of('/') == std::string_view::npos) {
        return std::string(path.substr(0, slash + 1));
    }
    while (!head.empty() && head.back() == '/') head.remove_suffix(1);
    return std::string(head);
}

std::string finalSegment(std::string_view path) {
    while (!path.empty() && path.back() == '/') path.remove_suffix(1);
    auto slash = path.rfind('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

std::string relativeTo(std::string_view path, std::string_view root) {
    std::string rel = trimPrefix(path, root);
    auto first = rel.find_first_not_of('/');
    return first == std::string::npos ? std::string{} : rel.substr(first);
}

} // namespace Courier::Core::Transfer
