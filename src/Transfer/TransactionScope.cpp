/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "TransactionScope.h"
#include "TransferError.h"
#include "../Logging/Logger.h"
#include <format>

namespace Courier::Core::Transfer {

TransactionScope::TransactionScope(IO::ITransactionalBackend* backend, std::string message)
    : _backend(backend), _message(std::move(message)) {
    if (!_backend) return;

    if (_backend->inTransaction()) {
        throw TransferError(TransferErrc::BackendFailure,
                            std::format("Cannot begin '{}': a transaction is already open", _message));
    }

    auto h = _backend->beginTransaction(_message);
    h.wait();
    if (h.status() != IO::FileOpStatus::Complete) {
        throw TransferError(TransferErrc::BackendFailure,
                            std::format("Cannot begin transaction '{}': {}", _message, IO::describe(h.errorInfo())));
    }
    _open = true;
    COURIER_LOG_DEBUG_CAT("Coordinator", std::format("Transaction begun: {}", _message));
}

TransactionScope::~TransactionScope() {
    if (!_open) return;

    auto h = _backend->abortTransaction();
    h.wait();
    if (h.status() != IO::FileOpStatus::Complete) {
        COURIER_LOG_ERROR_CAT("Coordinator", std::format("Failed to abort transaction '{}': {}", _message,
                                                         IO::describe(h.errorInfo())));
    } else {
        COURIER_LOG_WARNING_CAT("Coordinator", std::format("Transaction aborted: {}", _message));
    }
}

void TransactionScope::commit() {
    if (!_open) return;

    auto h = _backend->endTransaction();
    h.wait();
    if (h.status() != IO::FileOpStatus::Complete) {
        throw TransferError(TransferErrc::BackendFailure,
                            std::format("Cannot commit transaction '{}': {}", _message, IO::describe(h.errorInfo())));
    }
    _open = false;
    COURIER_LOG_DEBUG_CAT("Coordinator", std::format("Transaction committed: {}", _message));
}

} // namespace Courier::Core::Transfer
