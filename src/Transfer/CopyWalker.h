/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

/**
 * @file CopyWalker.h
 * @brief Expands directory and wildcard copies into per-file transfers
 *
 * A copy request is one of three shapes:
 * - Glob mode: the source carries a wildcard in its final segment. Matches are mirrored
 *   under the destination relative to the glob's parent; directory matches recurse with the
 *   same handles when the copy is recursive and are skipped otherwise.
 * - Directory mode: the source is a directory. Two content-addressed endpoints get one
 *   native copyDirectory() call; anything else is enumerated, directories are mirrored
 *   (including empty ones) and every file becomes a transfer.
 * - Single file: handed straight to FileTransfer.
 *
 * Each expansion fans its work items out through its own WorkContractGroup, registered with
 * the shared WorkService when there is one, and drains the group on the calling thread before
 * returning. Nested expansions therefore never wait on a worker that is waiting on them.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "FileTransfer.h"
#include "../Concurrency/WorkService.h"
#include "../VirtualFileSystem/BackendHandle.h"

namespace Courier::Core::Transfer {

// One resolved (source, destination) pair, consumed exactly once
struct WorkItem {
    IO::BackendHandle source;
    std::string sourcePath;
    IO::BackendHandle destination;
    std::string destinationPath;
    std::optional<uint64_t> sizeHint;
    bool isDirectory = false;
};

struct WalkSummary {
    size_t copied = 0;
    size_t skipped = 0;
    size_t failed = 0;

    bool ok() const noexcept { return failed == 0; }
};

// Directory test that also accepts branch roots on repository backends
bool isDirectoryLike(const IO::BackendHandle& handle, const std::string& path);

class CopyWalker {
public:
    explicit CopyWalker(FileTransfer& transfer, Concurrency::WorkService* service = nullptr);

    /**
     * @brief Copies srcPath to dstPath, expanding directories and wildcards
     * @throws TransferError(InvalidGlob) before any backend call when a wildcard sits
     *         outside the final segment
     * @return Per-item tallies; item failures are logged, not thrown
     */
    WalkSummary copy(const IO::BackendHandle& src, const std::string& srcPath,
                     const IO::BackendHandle& dst, const std::string& dstPath,
                     bool recursive);

private:
    struct Tally {
        std::atomic<size_t> copied{0};
        std::atomic<size_t> skipped{0};
        std::atomic<size_t> failed{0};

        void record(TransferOutcome outcome);
        WalkSummary snapshot() const;
    };

    void copyGlob(const IO::BackendHandle& src, const std::string& pattern,
                  const IO::BackendHandle& dst, const std::string& dstPath,
                  bool recursive, Tally& tally);
    void copyDirectory(const IO::BackendHandle& src, const std::string& srcPath,
                       const IO::BackendHandle& dst, const std::string& dstPath,
                       bool recursive, Tally& tally);

    bool ensureDirectory(const IO::BackendHandle& dst, const std::string& path, Tally& tally);
    void dispatch(const std::vector<WorkItem>& items, Tally& tally);
    void run(const WorkItem& item, Tally& tally);

    FileTransfer& _transfer;
    Concurrency::WorkService* _service;
};

} // namespace Courier::Core::Transfer
