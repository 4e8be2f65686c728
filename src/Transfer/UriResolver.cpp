/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "UriResolver.h"
#include "PathAlgebra.h"
#include "TransferError.h"
#include "../Logging/Logger.h"
#include <filesystem>
#include <format>
#include <vector>

namespace Courier::Core::Transfer {

UriResolver::UriResolver(std::shared_ptr<IO::BackendRegistry> registry)
    : _registry(std::move(registry)) {
    if (!_registry) {
        throw TransferError(TransferErrc::BackendUnavailable, "UriResolver requires a backend registry");
    }
}

bool UriResolver::isContentAddressedTag(const std::string& tag) {
    return tag == IO::BackendRegistry::ContentAddressedTag;
}

IO::BackendHandle UriResolver::handleFor(const std::string& tag) const {
    auto backend = _registry->create(tag);
    if (!backend) {
        if (isContentAddressedTag(tag)) {
            throw TransferError(TransferErrc::BackendUnavailable,
                                std::format("No {} session is configured; log in before using {}:// paths", tag, tag));
        }
        throw TransferError(TransferErrc::BackendUnavailable,
                            std::format("No backend registered for protocol '{}'", tag));
    }
    // The handle keeps the requested alias even when the backend lists another tag first
    return IO::BackendHandle(std::move(backend), tag);
}

ResolvedUri UriResolver::resolve(const std::string& uri) const {
    if (uri.empty()) {
        throw TransferError(TransferErrc::InvalidUri, "Empty URI");
    }

    const std::string separator = Separator;
    if (uri.find(separator) == std::string::npos) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(std::filesystem::path(uri), ec);
        if (ec) {
            throw TransferError(TransferErrc::InvalidUri,
                                std::format("Cannot resolve local path {}: {}", uri, ec.message()));
        }
        return ResolvedUri{handleFor(LocalTag), stripTrailingSlashes(absolute.lexically_normal().generic_string())};
    }

    std::vector<std::string> parts;
    size_t pos = 0;
    while (true) {
        auto next = uri.find(separator, pos);
        parts.push_back(uri.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        if (next == std::string::npos) break;
        pos = next + separator.size();
    }
    if (parts.size() != 2) {
        COURIER_LOG_WARNING_CAT("Resolver", std::format("Invalid URL: {}", uri));
    }

    const std::string& tag = parts[0];
    if (tag.empty()) {
        throw TransferError(TransferErrc::InvalidUri, std::format("Missing protocol in {}", uri));
    }
    return ResolvedUri{handleFor(tag), parts[1]};
}

} // namespace Courier::Core::Transfer
