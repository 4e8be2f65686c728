/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

#include <string>
#include <string_view>

namespace Courier::Core::Transfer {

/**
 * @brief Components of a content-addressed repository path
 *
 * Accepts `user/repo/branch/path`, optionally prefixed by `xet://` or by the session's
 * domain (`https://xethub.com/user/repo/...`). Missing trailing components are left empty,
 * so `user/repo/main` is a branch root: branch set, path empty.
 */
struct XetPath {
    std::string user;
    std::string repository;
    std::string branch;
    std::string path;

    bool isBranchRoot() const { return !branch.empty() && path.empty(); }

    // `user/repo`, the repository key used by duplicate and attribute calls
    std::string repositoryKey() const;
};

XetPath parseXetPath(std::string_view uriOrPath, std::string_view domain = {});

} // namespace Courier::Core::Transfer
