/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "TransferCoordinator.h"
#include "CopyValidation.h"
#include "PathAlgebra.h"
#include "TransactionScope.h"
#include "TransferError.h"
#include "XetPath.h"
#include "../Logging/Logger.h"
#include "../VirtualFileSystem/GlobMatch.h"
#include <format>

namespace Courier::Core::Transfer {

namespace {
    std::string joinList(const std::vector<std::string>& items) {
        std::string out;
        for (const auto& item : items) {
            if (!out.empty()) out += ", ";
            out += item;
        }
        return out;
    }
}

TransferCoordinator::TransferCoordinator(std::shared_ptr<IO::BackendRegistry> registry,
                                         Concurrency::PermitPool& permits,
                                         TransferConfig config,
                                         Concurrency::WorkService* service)
    : _config(std::move(config))
    , _resolver(std::move(registry))
    , _transfer(_config, permits)
    , _walker(_transfer, service) {
}

OperationResult TransferCoordinator::summarize(const WalkSummary& summary, const std::string& what) const {
    if (summary.ok()) {
        return OperationResult::ok(std::format("{}: {} copied, {} skipped", what, summary.copied, summary.skipped));
    }
    return OperationResult::failure(std::format("{}: {} of {} items failed", what, summary.failed,
                                                summary.copied + summary.skipped + summary.failed),
                                    summary.failed);
}

OperationResult TransferCoordinator::copy(const std::vector<std::string>& sources, const std::string& destination,
                                          bool recursive, std::optional<std::string> message) {
    if (sources.empty()) {
        throw TransferError(TransferErrc::InvalidUri, "No source given");
    }

    auto dst = _resolver.resolve(destination);

    // Resolve and validate every source before the first byte moves
    std::vector<ResolvedUri> resolved;
    resolved.reserve(sources.size());
    for (const auto& source : sources) {
        auto src = _resolver.resolve(source);
        const auto path = stripTrailingSlashes(src.path);
        if (IO::hasWildcard(path)) {
            validateGlob(path, source);
        }
        validateCopy(src.handle, src.path, dst.handle, dst.path);
        resolved.push_back(std::move(src));
    }

    const bool destinationIsDirectory = isDirectoryLike(dst.handle, stripTrailingSlashes(dst.path));

    const std::string label = message.value_or(
        sources.size() == 1 ? std::format("copy {} to {}", sources.front(), destination)
                            : std::format("copy [{}] to {}", joinList(sources), destination));

    WalkSummary total;
    try {
        TransactionScope transaction(dst.handle.transactional(), label);

        for (size_t i = 0; i < resolved.size(); ++i) {
            const auto& src = resolved[i];
            std::string target = dst.path;
            // cp src/some/path dest/where with an existing dest/where lands in dest/where/path
            if (destinationIsDirectory && !IO::hasWildcard(sources[i])) {
                target = joinPath(stripTrailingSlashes(dst.path), finalSegment(src.path));
            }

            auto summary = _walker.copy(src.handle, src.path, dst.handle, target, recursive);
            total.copied += summary.copied;
            total.skipped += summary.skipped;
            total.failed += summary.failed;
        }

        transaction.commit();
    } catch (const TransferError& e) {
        if (e.code() != TransferErrc::BackendFailure) throw;
        COURIER_LOG_ERROR_CAT("Coordinator", e.what());
        return OperationResult::failure(e.what(), total.failed + 1);
    }

    return summarize(total, label);
}

OperationResult TransferCoordinator::move(const std::string& source, const std::string& destination,
                                          bool recursive, std::optional<std::string> message) {
    auto src = _resolver.resolve(source);
    auto dst = _resolver.resolve(destination);

    if (src.handle.protocol() != dst.handle.protocol()) {
        throw TransferError(TransferErrc::CrossBackendMove,
                            std::format("Unable to move between different protocols {}, {}. You may want to copy instead",
                                        src.handle.protocol(), dst.handle.protocol()));
    }

    const std::string label = message.value_or(
        recursive ? std::format("move {} to {} recursively", source, destination)
                  : std::format("move {} to {}", source, destination));

    try {
        TransactionScope transaction(dst.handle.transactional(), label);

        auto h = dst.handle->moveFile(src.path, dst.path);
        h.wait();
        if (h.status() != IO::FileOpStatus::Complete) {
            const auto error = std::format("Failed to move {} to {}: {}", src.handle.describe(src.path),
                                           dst.handle.describe(dst.path), IO::describe(h.errorInfo()));
            COURIER_LOG_ERROR_CAT("Coordinator", error);
            return OperationResult::failure(error);
        }

        transaction.commit();
    } catch (const TransferError& e) {
        COURIER_LOG_ERROR_CAT("Coordinator", e.what());
        return OperationResult::failure(e.what());
    }

    return OperationResult::ok(label);
}

OperationResult TransferCoordinator::remove(const std::vector<std::string>& paths, bool recursive,
                                            std::optional<std::string> message) {
    if (paths.empty()) {
        throw TransferError(TransferErrc::InvalidUri, "No path given");
    }

    std::vector<ResolvedUri> resolved;
    resolved.reserve(paths.size());
    for (const auto& path : paths) {
        resolved.push_back(_resolver.resolve(path));
        if (resolved.back().handle.protocol() != resolved.front().handle.protocol()) {
            throw TransferError(TransferErrc::Unsupported,
                                std::format("Cannot delete across protocols in one command ({} and {})",
                                            resolved.front().handle.protocol(), resolved.back().handle.protocol()));
        }
    }

    const auto& handle = resolved.front().handle;
    auto* repo = handle.transactional();
    if (repo) {
        for (const auto& r : resolved) {
            if (parseXetPath(r.path, repo->domain()).isBranchRoot()) {
                throw TransferError(TransferErrc::BranchDeletion,
                                    "Cannot delete branches with 'rm' as this is a non-reversible operation "
                                    "and history will not be preserved. Use 'xet branch del'");
            }
        }
    }

    const std::string label = message.value_or(std::format("delete [{}]", joinList(paths)));

    try {
        TransactionScope transaction(repo, label);

        for (const auto& r : resolved) {
            auto h = r.handle->remove(r.path, recursive);
            h.wait();
            if (h.status() != IO::FileOpStatus::Complete) {
                const auto error = std::format("Failed to delete {}: {}", r.handle.describe(r.path),
                                               IO::describe(h.errorInfo()));
                COURIER_LOG_ERROR_CAT("Coordinator", error);
                return OperationResult::failure(error);
            }
        }

        transaction.commit();
    } catch (const TransferError& e) {
        COURIER_LOG_ERROR_CAT("Coordinator", e.what());
        return OperationResult::failure(e.what());
    }

    return OperationResult::ok(label);
}

OperationResult TransferCoordinator::duplicate(const std::string& source, std::optional<std::string> destination,
                                               Visibility visibility) {
    auto src = _resolver.resolve(source);
    auto* repo = src.handle.transactional();
    if (!repo || !src.handle.isContentAddressed()) {
        throw TransferError(TransferErrc::Unsupported,
                            std::format("duplicate requires a {}:// repository, got {}",
                                        IO::BackendRegistry::ContentAddressedTag, source));
    }

    const std::string repoName = finalSegment(source);
    const std::string target = destination.value_or(
        std::format("{}://{}/{}", IO::BackendRegistry::ContentAddressedTag, repo->currentUser(), repoName));
    if (!destination) {
        COURIER_LOG_DEBUG_CAT("Coordinator", std::format("Duplicating to {}", target));
    }

    auto dst = _resolver.resolve(target);
    auto* dstRepo = dst.handle.transactional();
    if (!dstRepo) {
        throw TransferError(TransferErrc::Unsupported,
                            std::format("duplicate destination must be a repository, got {}", target));
    }

    auto h = dstRepo->duplicateRepository(src.path, dst.path);
    h.wait();
    if (h.status() != IO::FileOpStatus::Complete) {
        throw TransferError(TransferErrc::BackendFailure,
                            std::format("Failed to duplicate {} to {}: {}", source, target, IO::describe(h.errorInfo())));
    }

    if (visibility == Visibility::Unchanged) {
        return OperationResult::ok(std::format("duplicated {} to {}", source, target));
    }

    COURIER_LOG_DEBUG_CAT("Coordinator", "Duplicate Success. Changing permissions...");
    auto attr = dstRepo->setRepositoryAttribute(dst.path, "private", visibility == Visibility::Private);
    attr.wait();
    if (attr.status() != IO::FileOpStatus::Complete) {
        const auto parsed = parseXetPath(dst.path, dstRepo->domain());
        const auto settings = std::format("{}/{}/{}/settings", dstRepo->domain(),
                                          parsed.user.empty() ? dstRepo->currentUser() : parsed.user,
                                          parsed.repository.empty() ? repoName : parsed.repository);
        COURIER_LOG_WARNING_CAT("Coordinator", std::format("An error has occurred setting repository permissions: {}",
                                                           IO::describe(attr.errorInfo())));
        COURIER_LOG_WARNING_CAT("Coordinator", std::format("Permission changes may not have been made. "
                                                           "Please change it manually at: {}", settings));
        return OperationResult::failure(std::format("duplicated {} to {}, visibility unchanged (see {})",
                                                    source, target, settings));
    }
    COURIER_LOG_DEBUG_CAT("Coordinator", "Repo permissions set successfully");
    return OperationResult::ok(std::format("duplicated {} to {}", source, target));
}

IO::FileMetadata TransferCoordinator::info(const std::string& uri) {
    auto resolved = _resolver.resolve(uri);
    auto h = resolved.handle->getMetadata(resolved.path);
    h.wait();
    if (h.status() != IO::FileOpStatus::Complete || !h.metadata()) {
        throw TransferError(TransferErrc::BackendFailure,
                            std::format("Cannot stat {}: {}", resolved.handle.describe(resolved.path),
                                        IO::describe(h.errorInfo())));
    }
    return *h.metadata();
}

} // namespace Courier::Core::Transfer
