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
#include "../VirtualFileSystem/ITransactionalBackend.h"

namespace Courier::Core::Transfer {

/**
 * @brief Scoped begin/end of a backend transaction
 *
 * Opens the transaction on construction and aborts it on destruction unless commit()
 * succeeded first, so every exit path (early return, exception) closes it. A null backend
 * makes the scope inert, which lets callers wrap non-transactional destinations uniformly.
 *
 * @code
 * TransactionScope tx(dst.transactional(), "delete [a, b]");
 * for (auto& p : paths) removeOrThrow(p);
 * tx.commit();
 * @endcode
 */
class TransactionScope {
public:
    /**
     * @throws TransferError(BackendFailure) when a transaction is already open on the backend
     *         or the backend refuses to begin one
     */
    TransactionScope(IO::ITransactionalBackend* backend, std::string message);
    ~TransactionScope();

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    /**
     * @brief Ends the transaction, attributing its mutations to the message
     * @throws TransferError(BackendFailure) when the backend rejects the commit; the
     *         destructor then aborts
     */
    void commit();

    bool active() const noexcept { return _open; }
    const std::string& message() const noexcept { return _message; }

private:
    IO::ITransactionalBackend* _backend;
    std::string _message;
    bool _open = false;
};

} // namespace Courier::Core::Transfer
