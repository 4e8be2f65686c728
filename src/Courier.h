/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#pragma once

/**
 * @file Courier.h
 * @brief Single header that includes all Courier components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Concurrency
#include "Concurrency/IConcurrencyProvider.h"
#include "Concurrency/PermitPool.h"
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkContractHandle.h"
#include "Concurrency/WorkService.h"

// Virtual File System
#include "VirtualFileSystem/BackendHandle.h"
#include "VirtualFileSystem/BackendRegistry.h"
#include "VirtualFileSystem/FileOperationHandle.h"
#include "VirtualFileSystem/FileStream.h"
#include "VirtualFileSystem/GlobMatch.h"
#include "VirtualFileSystem/IFileSystemBackend.h"
#include "VirtualFileSystem/ITransactionalBackend.h"
#include "VirtualFileSystem/LocalFileSystemBackend.h"
#include "VirtualFileSystem/MemoryFileSystemBackend.h"

// Transfer
#include "Transfer/CopyValidation.h"
#include "Transfer/CopyWalker.h"
#include "Transfer/FileTransfer.h"
#include "Transfer/PathAlgebra.h"
#include "Transfer/TransactionScope.h"
#include "Transfer/TransferConfig.h"
#include "Transfer/TransferCoordinator.h"
#include "Transfer/TransferError.h"
#include "Transfer/UriResolver.h"
#include "Transfer/XetPath.h"
