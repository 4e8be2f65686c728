/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

/**
 * @file UriResolver.h
 * @brief Turns `tag://path` strings into bound backend handles
 *
 * A URI without `://` names the local filesystem and is made absolute. Otherwise the part
 * before the separator selects a backend from the BackendRegistry and the handle records the
 * tag exactly as requested, so aliases of one backend keep the caller's spelling.
 */

#pragma once

#include <memory>
#include <string>
#include "../VirtualFileSystem/BackendHandle.h"
#include "../VirtualFileSystem/BackendRegistry.h"

namespace Courier::Core::Transfer {

struct ResolvedUri {
    IO::BackendHandle handle;
    std::string path;
};

class UriResolver {
public:
    static constexpr const char* Separator = "://";
    static constexpr const char* LocalTag = "file";

    explicit UriResolver(std::shared_ptr<IO::BackendRegistry> registry);

    /**
     * @brief Resolves a URI to a backend handle and backend-relative path
     * @throws TransferError(InvalidUri) for an empty URI or empty tag
     * @throws TransferError(BackendUnavailable) when no backend serves the tag
     */
    ResolvedUri resolve(const std::string& uri) const;

    // True when the tag names the content-addressed backend
    static bool isContentAddressedTag(const std::string& tag);

    const std::shared_ptr<IO::BackendRegistry>& registry() const noexcept { return _registry; }

private:
    IO::BackendHandle handleFor(const std::string& tag) const;

    std::shared_ptr<IO::BackendRegistry> _registry;
};

} // namespace Courier::Core::Transfer
