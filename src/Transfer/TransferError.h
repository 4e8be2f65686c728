/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

/**
 * @file TransferError.h
 * @brief Fatal orchestration errors
 *
 * Resolution and validation failures abort an operation before any data moves and reach the
 * caller as a TransferError. Per-item transfer failures never use this type; they are logged
 * and counted (see FileTransfer and CopyWalker).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Courier::Core::Transfer {

enum class TransferErrc {
    InvalidUri,
    BackendUnavailable,
    PathMismatch,
    InvalidGlob,
    BranchNotFound,
    CrossBackendMove,
    BranchDeletion,
    Unsupported,
    BackendFailure
};

inline const char* toString(TransferErrc code) noexcept {
    switch (code) {
        case TransferErrc::InvalidUri:         return "InvalidUri";
        case TransferErrc::BackendUnavailable: return "BackendUnavailable";
        case TransferErrc::PathMismatch:       return "PathMismatch";
        case TransferErrc::InvalidGlob:        return "InvalidGlob";
        case TransferErrc::BranchNotFound:     return "BranchNotFound";
        case TransferErrc::CrossBackendMove:   return "CrossBackendMove";
        case TransferErrc::BranchDeletion:     return "BranchDeletion";
        case TransferErrc::Unsupported:        return "Unsupported";
        case TransferErrc::BackendFailure:     return "BackendFailure";
    }
    return "Unknown";
}

class TransferError : public std::runtime_error {
public:
    TransferError(TransferErrc code, const std::string& message)
        : std::runtime_error(message), _code(code) {}

    TransferErrc code() const noexcept { return _code; }

private:
    TransferErrc _code;
};

} // namespace Courier::Core::Transfer
