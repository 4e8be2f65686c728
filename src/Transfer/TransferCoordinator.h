/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

/**
 * @file TransferCoordinator.h
 * @brief Entry points for copy, move, remove, duplicate and info
 *
 * The coordinator resolves URIs, runs pre-flight validation, and brackets mutations of
 * transactional destinations in a TransactionScope. Resolution and validation failures are
 * fatal and thrown as TransferError before any data moves. Failures after that point are
 * reported through the logger and summarized in the returned OperationResult.
 *
 * @code
 * auto registry = IO::BackendRegistry::createDefault();
 * Concurrency::PermitPool permits(config.maxConcurrentCopies);
 * TransferCoordinator coordinator(registry, permits, config, &service);
 * auto result = coordinator.copy({"data/*.csv"}, "memory://staging", true);
 * @endcode
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "CopyWalker.h"
#include "FileTransfer.h"
#include "TransferConfig.h"
#include "UriResolver.h"
#include "../Concurrency/PermitPool.h"
#include "../Concurrency/WorkService.h"

namespace Courier::Core::Transfer {

struct OperationResult {
    bool success = true;
    size_t failedItems = 0;
    std::string message;

    static OperationResult ok(std::string message = {}) { return {true, 0, std::move(message)}; }
    static OperationResult failure(std::string message, size_t failedItems = 1) {
        return {false, failedItems, std::move(message)};
    }
};

enum class Visibility { Unchanged, Private, Public };

class TransferCoordinator {
public:
    TransferCoordinator(std::shared_ptr<IO::BackendRegistry> registry,
                        Concurrency::PermitPool& permits,
                        TransferConfig config = {},
                        Concurrency::WorkService* service = nullptr);

    /**
     * @brief Copies each source to the destination
     *
     * An existing destination directory receives each non-wildcard source under its final
     * segment. A transactional destination gets one transaction for the whole command,
     * labeled with message or `copy SRC to DST`.
     */
    OperationResult copy(const std::vector<std::string>& sources, const std::string& destination,
                         bool recursive, std::optional<std::string> message = std::nullopt);

    /**
     * @throws TransferError(CrossBackendMove) when the endpoints use different protocol tags
     */
    OperationResult move(const std::string& source, const std::string& destination,
                         bool recursive, std::optional<std::string> message = std::nullopt);

    /**
     * @brief Removes every path inside one transaction when the backend is transactional
     * @throws TransferError(BranchDeletion) for a branch root on a repository backend
     */
    OperationResult remove(const std::vector<std::string>& paths, bool recursive = false,
                           std::optional<std::string> message = std::nullopt);

    /**
     * @brief Creates a repository as a copy of another
     *
     * The default destination is `xet://<current user>/<source repository name>`. A failed
     * visibility change is reported with a link to the settings page; the duplicate stays.
     */
    OperationResult duplicate(const std::string& source, std::optional<std::string> destination = std::nullopt,
                              Visibility visibility = Visibility::Unchanged);

    // Backend metadata for one URI
    IO::FileMetadata info(const std::string& uri);

    const UriResolver& resolver() const noexcept { return _resolver; }
    const TransferConfig& config() const noexcept { return _config; }

private:
    OperationResult summarize(const WalkSummary& summary, const std::string& what) const;

    TransferConfig _config;
    UriResolver _resolver;
    FileTransfer _transfer;
    CopyWalker _walker;
};

} // namespace Courier::Core::Transfer
