/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "CourierApp.h"
#include "CommandLine.h"
#include "../Concurrency/PermitPool.h"
#include "../Concurrency/WorkService.h"
#include "../Logging/Logger.h"
#include "../Transfer/TransferCoordinator.h"
#include "../Transfer/TransferError.h"
#include <chrono>
#include <format>
#include <iostream>

namespace Courier::Tools {

using namespace Courier::Core;

namespace {
    void printInfo(const std::string& uri, const IO::FileMetadata& meta) {
        std::cout << "name: " << uri << '\n';
        std::cout << "type: " << (meta.isDirectory ? "directory" : "file") << '\n';
        std::cout << "size: " << meta.size << '\n';
        if (meta.isSymlink) std::cout << "symlink: true\n";
        if (meta.lastModified) {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(meta.lastModified->time_since_epoch());
            std::cout << "mtime: " << seconds.count() << '\n';
        }
    }

    int toExitCode(const Transfer::OperationResult& result) {
        if (!result.success) {
            COURIER_LOG_ERROR_CAT("CLI", result.message);
            return ExitError;
        }
        COURIER_LOG_DEBUG_CAT("CLI", result.message);
        return ExitOk;
    }

    int dispatch(const CommandLine& cmd, Transfer::TransferCoordinator& coordinator) {
        switch (cmd.kind) {
            case CommandKind::Copy: {
                std::vector<std::string> sources(cmd.paths.begin(), cmd.paths.end() - 1);
                return toExitCode(coordinator.copy(sources, cmd.paths.back(), cmd.recursive, cmd.message));
            }
            case CommandKind::Move:
                return toExitCode(coordinator.move(cmd.paths[0], cmd.paths[1], cmd.recursive, cmd.message));
            case CommandKind::Remove:
                return toExitCode(coordinator.remove(cmd.paths, cmd.recursive, cmd.message));
            case CommandKind::Info:
                printInfo(cmd.paths[0], coordinator.info(cmd.paths[0]));
                return ExitOk;
            case CommandKind::Duplicate: {
                std::optional<std::string> destination;
                if (cmd.paths.size() > 1) destination = cmd.paths[1];
                return toExitCode(coordinator.duplicate(cmd.paths[0], destination, cmd.visibility));
            }
            default:
                return ExitUsage;
        }
    }
}

int runCourier(int argc, const char* const argv[], std::shared_ptr<IO::BackendRegistry> registry) {
    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        COURIER_LOG_ERROR_CAT("CLI", e.what());
        std::cerr << usageText();
        return ExitUsage;
    }

    if (cmd.kind == CommandKind::Help) {
        std::cout << usageText();
        return ExitOk;
    }
    if (cmd.kind == CommandKind::Login || cmd.kind == CommandKind::Mount) {
        COURIER_LOG_ERROR_CAT("CLI", std::format("'{}' is provided by the external xet service and is not available here",
                                                 cmd.name));
        return ExitUsage;
    }

    auto& logger = Logging::Logger::global();
    const auto previousLevel = logger.minLevel();
    if (cmd.verbose) {
        logger.setMinLevel(Logging::LogLevel::Debug);
    }

    auto config = Transfer::TransferConfig::fromEnvironment();
    cmd.applyTo(config);

    Concurrency::WorkService::Config serviceConfig;
    serviceConfig.threadCount = config.workerThreads;
    Concurrency::WorkService service(serviceConfig);
    service.start();

    Concurrency::PermitPool permits(config.maxConcurrentCopies);
    Transfer::TransferCoordinator coordinator(std::move(registry), permits, config, &service);

    int rc = ExitError;
    try {
        rc = dispatch(cmd, coordinator);
    } catch (const Transfer::TransferError& e) {
        COURIER_LOG_ERROR_CAT("CLI", e.what());
        rc = ExitError;
    } catch (const std::exception& e) {
        COURIER_LOG_FATAL_CAT("CLI", std::format("Unexpected error: {}", e.what()));
        rc = ExitError;
    }

    service.stop();
    if (cmd.verbose) {
        logger.setMinLevel(previousLevel);
    }
    logger.flush();
    return rc;
}

} // namespace Courier::Tools
