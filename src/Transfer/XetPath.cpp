/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "XetPath.h"
#include <vector>

namespace Courier::Core::Transfer {

namespace {
    bool consumePrefix(std::string_view& text, std::string_view prefix) {
        if (prefix.empty() || text.substr(0, prefix.size()) != prefix) return false;
        text.remove_prefix(prefix.size());
        return true;
    }
}

std::string XetPath::repositoryKey() const {
    if (repository.empty()) return user;
    return user + "/" + repository;
}

XetPath parseXetPath(std::string_view uriOrPath, std::string_view domain) {
    std::string_view rest = uriOrPath;
    if (!consumePrefix(rest, "xet://")) {
        std::string_view trimmedDomain = domain;
        while (!trimmedDomain.empty() && trimmedDomain.back() == '/') trimmedDomain.remove_suffix(1);
        if (consumePrefix(rest, trimmedDomain)) {
            // domain matched; fall through to component split
        } else if (auto scheme = rest.find("://"); scheme != std::string_view::npos) {
            // Foreign host spelling: drop scheme and host
            rest.remove_prefix(scheme + 3);
            auto slash = rest.find('/');
            rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
        }
    }

    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (pos <= rest.size()) {
        auto next = rest.find('/', pos);
        auto part = rest.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        if (!part.empty()) parts.push_back(part);
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }

    XetPath out;
    if (parts.size() > 0) out.user = parts[0];
    if (parts.size() > 1) out.repository = parts[1];
    if (parts.size() > 2) out.branch = parts[2];
    for (size_t i = 3; i < parts.size(); ++i) {
        if (!out.path.empty()) out.path += '/';
        out.path += parts[i];
    }
    return out;
}

} // namespace Courier::Core::Transfer
