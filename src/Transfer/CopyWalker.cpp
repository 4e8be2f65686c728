/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "CopyWalker.h"
#include "PathAlgebra.h"
#include "TransferError.h"
#include "../Concurrency/WorkContractGroup.h"
#include "../Logging/Logger.h"
#include "../VirtualFileSystem/GlobMatch.h"
#include <format>

namespace Courier::Core::Transfer {

namespace {
    // Keeps a group registered with the service for the lifetime of one expansion
    class ScopedGroupRegistration {
    public:
        ScopedGroupRegistration(Concurrency::WorkService* service, Concurrency::WorkContractGroup& group)
            : _service(service), _group(group) {
            if (_service && _service->isRunning()) {
                _registered = _service->addWorkContractGroup(&_group) ==
                              Concurrency::WorkService::GroupOperationStatus::Added;
            }
        }

        ~ScopedGroupRegistration() {
            if (_registered) {
                _service->removeWorkContractGroup(&_group);
            }
        }

        ScopedGroupRegistration(const ScopedGroupRegistration&) = delete;
        ScopedGroupRegistration& operator=(const ScopedGroupRegistration&) = delete;

    private:
        Concurrency::WorkService* _service;
        Concurrency::WorkContractGroup& _group;
        bool _registered = false;
    };
}

bool isDirectoryLike(const IO::BackendHandle& handle, const std::string& path) {
    if (auto* repo = handle.transactional()) {
        return repo->isDirectoryOrBranch(path);
    }
    return handle->isDirectory(path);
}

void CopyWalker::Tally::record(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Copied:  copied.fetch_add(1, std::memory_order_relaxed); break;
        case TransferOutcome::Skipped: skipped.fetch_add(1, std::memory_order_relaxed); break;
        case TransferOutcome::Failed:  failed.fetch_add(1, std::memory_order_relaxed); break;
    }
}

WalkSummary CopyWalker::Tally::snapshot() const {
    WalkSummary summary;
    summary.copied = copied.load(std::memory_order_relaxed);
    summary.skipped = skipped.load(std::memory_order_relaxed);
    summary.failed = failed.load(std::memory_order_relaxed);
    return summary;
}

CopyWalker::CopyWalker(FileTransfer& transfer, Concurrency::WorkService* service)
    : _transfer(transfer), _service(service) {
}

WalkSummary CopyWalker::copy(const IO::BackendHandle& src, const std::string& srcPath,
                             const IO::BackendHandle& dst, const std::string& dstPath,
                             bool recursive) {
    const std::string source = stripTrailingSlashes(srcPath);
    const std::string destination = stripTrailingSlashes(dstPath);
    Tally tally;

    // Wildcards are checked before the first backend call
    if (IO::hasWildcard(source)) {
        validateGlob(source, src.describe(srcPath));
        copyGlob(src, source, dst, destination, recursive, tally);
    } else if (isDirectoryLike(src, source)) {
        copyDirectory(src, source, dst, destination, recursive, tally);
    } else {
        tally.record(_transfer.transfer(src, source, dst, destination));
    }
    return tally.snapshot();
}

void CopyWalker::copyGlob(const IO::BackendHandle& src, const std::string& pattern,
                          const IO::BackendHandle& dst, const std::string& dstPath,
                          bool recursive, Tally& tally) {
    const std::string root = globRoot(pattern);

    auto matches = src->glob(pattern);
    matches.wait();
    if (matches.status() != IO::FileOpStatus::Complete) {
        COURIER_LOG_ERROR_CAT("Walker", std::format("Cannot expand {}: {}", src.describe(pattern),
                                                    IO::describe(matches.errorInfo())));
        tally.failed.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    std::vector<WorkItem> items;
    for (const auto& entry : matches.directoryEntries()) {
        const bool isDirectory = entry.metadata.isDirectory;
        if (isDirectory && !recursive) {
            COURIER_LOG_DEBUG_CAT("Walker", std::format("Skipping directory {} (not recursive)", entry.fullPath));
            continue;
        }

        std::string relative;
        try {
            relative = relativeTo(entry.fullPath, root);
        } catch (const TransferError& e) {
            COURIER_LOG_ERROR_CAT("Walker", e.what());
            tally.failed.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        const std::string target = joinPath(dstPath, relative);
        if (!ensureDirectory(dst, parentPath(target), tally)) continue;

        WorkItem item;
        item.source = src;
        item.sourcePath = entry.fullPath;
        item.destination = dst;
        item.destinationPath = target;
        item.isDirectory = isDirectory;
        if (!isDirectory) item.sizeHint = entry.metadata.size;
        items.push_back(std::move(item));
    }

    dispatch(items, tally);
}

void CopyWalker::copyDirectory(const IO::BackendHandle& src, const std::string& srcPath,
                               const IO::BackendHandle& dst, const std::string& dstPath,
                               bool recursive, Tally& tally) {
    if (!recursive) {
        COURIER_LOG_WARNING_CAT("Walker", std::format("Skipping directory {}: recursive copy not requested",
                                                      src.describe(srcPath)));
        tally.skipped.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (src.isContentAddressed() && dst.isContentAddressed()) {
        if (auto* repo = dst.transactional()) {
            COURIER_LOG_INFO_CAT("Walker", std::format("Copying {} to {}...", srcPath, dstPath));
            auto h = repo->copyDirectory(srcPath, dstPath);
            h.wait();
            if (h.status() != IO::FileOpStatus::Complete) {
                COURIER_LOG_ERROR_CAT("Walker", std::format("Failed to copy {}: {}", src.describe(srcPath),
                                                            IO::describe(h.errorInfo())));
                tally.failed.fetch_add(1, std::memory_order_relaxed);
            } else {
                tally.copied.fetch_add(1, std::memory_order_relaxed);
            }
            return;
        }
    }

    IO::ListDirectoryOptions options;
    options.recursive = true;
    options.includeDirectories = true;
    options.includeHidden = true;
    auto listing = src->listDirectory(srcPath, options);
    listing.wait();
    if (listing.status() != IO::FileOpStatus::Complete) {
        COURIER_LOG_ERROR_CAT("Walker", std::format("Cannot enumerate {}: {}", src.describe(srcPath),
                                                    IO::describe(listing.errorInfo())));
        tally.failed.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (!ensureDirectory(dst, dstPath, tally)) return;

    // Listings are ordered by path, so every directory is created before the files below it
    std::vector<WorkItem> items;
    for (const auto& entry : listing.directoryEntries()) {
        std::string relative;
        try {
            relative = relativeTo(entry.fullPath, srcPath);
        } catch (const TransferError& e) {
            COURIER_LOG_ERROR_CAT("Walker", e.what());
            tally.failed.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        if (relative.empty()) continue;

        const std::string target = joinPath(dstPath, relative);
        if (entry.metadata.isDirectory) {
            ensureDirectory(dst, target, tally);
            continue;
        }
        if (!ensureDirectory(dst, parentPath(target), tally)) continue;

        WorkItem item;
        item.source = src;
        item.sourcePath = entry.fullPath;
        item.destination = dst;
        item.destinationPath = target;
        item.sizeHint = entry.metadata.size;
        items.push_back(std::move(item));
    }

    dispatch(items, tally);
}

bool CopyWalker::ensureDirectory(const IO::BackendHandle& dst, const std::string& path, Tally& tally) {
    if (path.empty()) return true;

    auto h = dst->createDirectory(path);
    h.wait();
    if (h.status() != IO::FileOpStatus::Complete) {
        COURIER_LOG_ERROR_CAT("Walker", std::format("Cannot create directory {}: {}", dst.describe(path),
                                                    IO::describe(h.errorInfo())));
        tally.failed.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

void CopyWalker::dispatch(const std::vector<WorkItem>& items, Tally& tally) {
    if (items.empty()) return;

    Concurrency::WorkContractGroup group(_transfer.config().contractCapacity, "CopyWalker");
    ScopedGroupRegistration registration(_service, group);

    for (const auto& item : items) {
        auto work = [this, &item, &tally]() { run(item, tally); };
        auto handle = group.createContract(work);
        while (!handle.valid()) {
            // Group is full: help drain it, then wait for a slot if workers hold them all
            if (group.executeAllBackgroundWork() == 0) {
                group.waitForCapacity();
            }
            handle = group.createContract(work);
        }
        if (handle.schedule() != Concurrency::ScheduleResult::Scheduled) {
            handle.release();
            run(item, tally);
        }
    }

    group.executeAllBackgroundWork();
    group.wait();
}

void CopyWalker::run(const WorkItem& item, Tally& tally) {
    try {
        if (item.isDirectory) {
            // Directory match under a wildcard: recurse with the inherited handles
            copyDirectory(item.source, item.sourcePath, item.destination, item.destinationPath, true, tally);
        } else {
            tally.record(_transfer.transfer(item.source, item.sourcePath, item.destination,
                                            item.destinationPath, item.sizeHint));
        }
    } catch (const std::exception& e) {
        COURIER_LOG_ERROR_CAT("Walker", std::format("Failed to copy {}: {}",
                                                    item.source.describe(item.sourcePath), e.what()));
        tally.failed.fetch_add(1, std::memory_order_relaxed);
    } catch (...) {
        COURIER_LOG_ERROR_CAT("Walker", std::format("Failed to copy {}: unknown exception",
                                                    item.source.describe(item.sourcePath)));
        tally.failed.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace Courier::Core::Transfer
