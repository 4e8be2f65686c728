/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "FileTransfer.h"
#include "PathAlgebra.h"
#include "../Logging/Logger.h"
#include "../VirtualFileSystem/FileStream.h"
#include <algorithm>
#include <format>
#include <vector>

namespace Courier::Core::Transfer {

FileTransfer::FileTransfer(const TransferConfig& config, Concurrency::PermitPool& permits)
    : _config(config), _permits(permits) {
    if (_config.chunkSize == 0) {
        _config.chunkSize = TransferConfig{}.chunkSize;
    }
}

TransferOutcome FileTransfer::transfer(const IO::BackendHandle& src, const std::string& srcPath,
                                       const IO::BackendHandle& dst, const std::string& dstPath,
                                       std::optional<uint64_t> sizeHint) {
    if (finalSegment(dstPath) == _config.attributesMarker) {
        COURIER_LOG_INFO_CAT("Transfer", std::format("Skipping {} as that is required by the repository backend",
                                                     _config.attributesMarker));
        return TransferOutcome::Skipped;
    }
    COURIER_LOG_INFO_CAT("Transfer", std::format("Copying {} to {}...", srcPath, dstPath));

    // Both ends content-addressed: reference copy, no data flows through us
    if (src.isContentAddressed() && dst.isContentAddressed()) {
        if (auto* repo = dst.transactional()) {
            auto h = repo->copyFile(srcPath, dstPath);
            h.wait();
            if (h.status() != IO::FileOpStatus::Complete) {
                COURIER_LOG_ERROR_CAT("Transfer", std::format("Failed to copy {}: {}", src.describe(srcPath),
                                                              IO::describe(h.errorInfo())));
                return TransferOutcome::Failed;
            }
            return TransferOutcome::Copied;
        }
    }

    std::optional<std::string> failure;
    {
        auto permit = _permits.acquire();
        try {
            failure = stream(src, srcPath, dst, dstPath, sizeHint);
        } catch (const std::exception& e) {
            failure = e.what();
        }
    }

    if (failure) {
        COURIER_LOG_ERROR_CAT("Transfer", std::format("Failed to copy {}: {}", src.describe(srcPath), *failure));
        return TransferOutcome::Failed;
    }
    return TransferOutcome::Copied;
}

std::optional<std::string> FileTransfer::prepareDestination(const IO::BackendHandle& src, const std::string& srcPath,
                                                            const IO::BackendHandle& dst, const std::string& dstPath,
                                                            std::optional<uint64_t> sizeHint) {
    if (!dst.isContentAddressed()) return std::nullopt;

    if (!sizeHint) {
        auto info = src->getMetadata(srcPath);
        info.wait();
        if (info.status() != IO::FileOpStatus::Complete) {
            return std::format("size lookup failed: {}", IO::describe(info.errorInfo()));
        }
        if (info.metadata()) {
            sizeHint = info.metadata()->size;
        }
    }

    if (sizeHint && *sizeHint >= _config.largeObjectThreshold) {
        auto* repo = dst.transactional();
        if (!repo) return std::nullopt;
        auto hint = repo->prepareDeduplicationHints(dstPath);
        hint.wait();
        if (hint.status() != IO::FileOpStatus::Complete) {
            return std::format("deduplication hint failed: {}", IO::describe(hint.errorInfo()));
        }
    }
    return std::nullopt;
}

std::optional<std::string> FileTransfer::stream(const IO::BackendHandle& src, const std::string& srcPath,
                                                const IO::BackendHandle& dst, const std::string& dstPath,
                                                std::optional<uint64_t> sizeHint) {
    if (auto error = prepareDestination(src, srcPath, dst, dstPath, sizeHint)) {
        return error;
    }

    IO::StreamOptions readOptions;
    readOptions.mode = IO::StreamOptions::Read;
    auto in = src->openStream(srcPath, readOptions);
    if (!in || in->fail()) {
        return std::string("cannot open source for reading");
    }

    IO::StreamOptions writeOptions;
    writeOptions.mode = IO::StreamOptions::Write;
    writeOptions.createParentDirs = true;
    auto out = dst->openStream(dstPath, writeOptions);
    if (!out || out->fail()) {
        return std::format("cannot open {} for writing", dst.describe(dstPath));
    }

    // Small files do not need a full chunk buffer
    size_t bufferSize = _config.chunkSize;
    if (sizeHint) {
        bufferSize = static_cast<size_t>(std::clamp<uint64_t>(*sizeHint, 1, _config.chunkSize));
    }
    std::vector<std::byte> buffer(bufferSize);

    while (true) {
        auto r = in->read(buffer);
        if (!r.success()) {
            return std::format("read failed ({})", IO::toString(*r.error));
        }
        if (r.bytesTransferred == 0) break;

        auto w = out->write(std::span<const std::byte>(buffer.data(), r.bytesTransferred));
        if (!w.success() || w.bytesTransferred != r.bytesTransferred) {
            return std::format("write to {} failed ({})", dst.describe(dstPath),
                               IO::toString(w.error.value_or(IO::FileError::IOError)));
        }
        _bytesCopied.fetch_add(r.bytesTransferred, std::memory_order_relaxed);
    }

    out->close();
    if (out->fail()) {
        return std::format("cannot finalize {}", dst.describe(dstPath));
    }
    in->close();
    return std::nullopt;
}

} // namespace Courier::Core::Transfer
