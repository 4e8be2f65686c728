/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "CopyValidation.h"
#include "TransferError.h"
#include "XetPath.h"
#include <format>

namespace Courier::Core::Transfer {

namespace {
    void requireBranch(const IO::BackendHandle& handle, const std::string& path) {
        auto* repo = handle.transactional();
        if (!repo) return;
        auto h = repo->branchInfo(path);
        h.wait();
        if (h.status() != IO::FileOpStatus::Complete) {
            throw TransferError(TransferErrc::BranchNotFound,
                                std::format("Branch not found for {}: {}", handle.describe(path),
                                            IO::describe(h.errorInfo())));
        }
    }
}

void validateCopy(const IO::BackendHandle& src, const std::string& srcPath,
                  const IO::BackendHandle& dst, const std::string& dstPath) {
    if (src.isContentAddressed()) {
        requireBranch(src, srcPath);
    }

    if (dst.isContentAddressed()) {
        if (src.isContentAddressed()) {
            auto* srcRepo = src.transactional();
            auto* dstRepo = dst.transactional();
            const auto srcParsed = parseXetPath(srcPath, srcRepo ? srcRepo->domain() : std::string{});
            const auto dstParsed = parseXetPath(dstPath, dstRepo ? dstRepo->domain() : std::string{});
            if (srcParsed.path.empty() && dstParsed.path.empty()) {
                return;  // branch to branch
            }
        }
        requireBranch(dst, dstPath);
    }
}

} // namespace Courier::Core::Transfer
