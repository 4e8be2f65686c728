/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

#include <memory>
#include "../VirtualFileSystem/BackendRegistry.h"

namespace Courier::Tools {

constexpr int ExitOk = 0;
constexpr int ExitError = 1;
constexpr int ExitUsage = 2;

/**
 * @brief Parses and runs one `courier` command against the given registry
 *
 * The stock executable passes BackendRegistry::createDefault(), which knows the local and
 * memory backends only. Hosts that link a repository session install it with
 * setContentAddressedFactory() before calling this, which makes xet:// paths and
 * `duplicate` available.
 *
 * Log sinks are left as the caller configured them.
 * @return Process exit code (ExitOk, ExitError or ExitUsage)
 */
int runCourier(int argc, const char* const argv[], std::shared_ptr<Core::IO::BackendRegistry> registry);

} // namespace Courier::Tools
