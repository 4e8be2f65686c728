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
#include "../VirtualFileSystem/BackendHandle.h"

namespace Courier::Core::Transfer {

/**
 * @brief Pre-flight branch checks for a copy
 *
 * A content-addressed source must name an existing branch. So must a content-addressed
 * destination, unless both ends are content-addressed branch roots (a copy that creates the
 * destination branch).
 *
 * @throws TransferError(BranchNotFound)
 */
void validateCopy(const IO::BackendHandle& src, const std::string& srcPath,
                  const IO::BackendHandle& dst, const std::string& dstPath);

} // namespace Courier::Core::Transfer
