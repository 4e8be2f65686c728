/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include "TransferConfig.h"
#include "../Concurrency/PermitPool.h"
#include "../VirtualFileSystem/BackendHandle.h"

namespace Courier::Core::Transfer {

enum class TransferOutcome { Copied, Skipped, Failed };

/**
 * @brief Moves exactly one file between two backend handles
 *
 * Streaming holds a permit from the injected PermitPool for its whole duration, so the pool
 * bounds in-flight transfers across every walker and nesting level that shares it. Failures
 * are logged under the "Transfer" category with the `proto://path` of the source and come
 * back as TransferOutcome::Failed; nothing is thrown to the caller.
 */
class FileTransfer {
public:
    FileTransfer(const TransferConfig& config, Concurrency::PermitPool& permits);

    TransferOutcome transfer(const IO::BackendHandle& src, const std::string& srcPath,
                             const IO::BackendHandle& dst, const std::string& dstPath,
                             std::optional<uint64_t> sizeHint = std::nullopt);

    const TransferConfig& config() const noexcept { return _config; }
    Concurrency::PermitPool& permits() noexcept { return _permits; }

    uint64_t bytesCopied() const noexcept { return _bytesCopied.load(std::memory_order_relaxed); }

private:
    // Streams src into dst; returns the error text on failure
    std::optional<std::string> stream(const IO::BackendHandle& src, const std::string& srcPath,
                                      const IO::BackendHandle& dst, const std::string& dstPath,
                                      std::optional<uint64_t> sizeHint);

    std::optional<std::string> prepareDestination(const IO::BackendHandle& src, const std::string& srcPath,
                                                  const IO::BackendHandle& dst, const std::string& dstPath,
                                                  std::optional<uint64_t> sizeHint);

    TransferConfig _config;
    Concurrency::PermitPool& _permits;
    std::atomic<uint64_t> _bytesCopied{0};
};

} // namespace Courier::Core::Transfer
