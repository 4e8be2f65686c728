/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "CommandLine.h"
#include <boost/program_options.hpp>
#include <format>
#include <map>
#include <sstream>

namespace Courier::Tools {

namespace po = boost::program_options;

namespace {
    const std::map<std::string, CommandKind>& commandTable() {
        static const std::map<std::string, CommandKind> table = {
            {"cp", CommandKind::Copy},
            {"mv", CommandKind::Move},
            {"rm", CommandKind::Remove},
            {"info", CommandKind::Info},
            {"duplicate", CommandKind::Duplicate},
            {"login", CommandKind::Login},
            {"mount", CommandKind::Mount},
            {"help", CommandKind::Help},
        };
        return table;
    }

    po::options_description globalOptions() {
        po::options_description desc("Global options");
        desc.add_options()
            ("help,h", "Show this help message")
            ("verbose,v", po::bool_switch(), "Log debug detail")
            ("chunk-size", po::value<size_t>(), "Bytes per read/write while streaming")
            ("max-concurrent", po::value<size_t>(), "Maximum simultaneous file transfers")
            ("threads", po::value<uint32_t>(), "Worker threads (0 = hardware concurrency)");
        return desc;
    }

    po::options_description commandOptions(CommandKind kind) {
        po::options_description desc("Command options");
        switch (kind) {
            case CommandKind::Copy:
            case CommandKind::Move:
            case CommandKind::Remove:
                desc.add_options()
                    ("recursive,r", po::bool_switch(), "Recurse into directories")
                    ("message,m", po::value<std::string>(), "Commit message for repository destinations");
                break;
            case CommandKind::Duplicate:
                desc.add_options()
                    ("private", po::bool_switch(), "Make the new repository private")
                    ("public", po::bool_switch(), "Make the new repository public");
                break;
            default:
                break;
        }
        return desc;
    }

    void requireCount(const CommandLine& cmd, size_t min, size_t max) {
        const size_t n = cmd.paths.size();
        if (n < min || n > max) {
            if (min == max) {
                throw UsageError(std::format("'{}' expects {} argument{}, got {}", cmd.name, min, min == 1 ? "" : "s", n));
            }
            throw UsageError(std::format("'{}' expects at least {} arguments, got {}", cmd.name, min, n));
        }
    }
}

void CommandLine::applyTo(Core::Transfer::TransferConfig& config) const {
    if (chunkSize) config.chunkSize = *chunkSize;
    if (maxConcurrent) config.maxConcurrentCopies = *maxConcurrent;
    if (threads) config.workerThreads = *threads;
}

CommandLine parseCommandLine(int argc, const char* const argv[]) {
    CommandLine cmd;
    if (argc < 2) {
        return cmd;
    }

    cmd.name = argv[1];
    if (cmd.name == "-h" || cmd.name == "--help") {
        return cmd;
    }
    auto it = commandTable().find(cmd.name);
    if (it == commandTable().end()) {
        throw UsageError(std::format("Unknown command '{}'", cmd.name));
    }
    cmd.kind = it->second;

    po::options_description all;
    all.add(globalOptions()).add(commandOptions(cmd.kind));
    po::options_description hidden;
    hidden.add_options()("paths", po::value<std::vector<std::string>>()->composing(), "");
    all.add(hidden);

    po::positional_options_description positional;
    positional.add("paths", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc - 1, argv + 1).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }

    if (vm.count("help")) {
        cmd.kind = CommandKind::Help;
        return cmd;
    }

    if (vm.count("paths")) cmd.paths = vm["paths"].as<std::vector<std::string>>();
    cmd.verbose = vm["verbose"].as<bool>();
    if (vm.count("recursive")) cmd.recursive = vm["recursive"].as<bool>();
    if (vm.count("message")) cmd.message = vm["message"].as<std::string>();
    if (vm.count("chunk-size")) cmd.chunkSize = vm["chunk-size"].as<size_t>();
    if (vm.count("max-concurrent")) cmd.maxConcurrent = vm["max-concurrent"].as<size_t>();
    if (vm.count("threads")) cmd.threads = vm["threads"].as<uint32_t>();

    if (cmd.chunkSize && *cmd.chunkSize == 0) throw UsageError("--chunk-size must be positive");
    if (cmd.maxConcurrent && *cmd.maxConcurrent == 0) throw UsageError("--max-concurrent must be positive");

    switch (cmd.kind) {
        case CommandKind::Copy:      requireCount(cmd, 2, SIZE_MAX); break;
        case CommandKind::Move:      requireCount(cmd, 2, 2); break;
        case CommandKind::Remove:    requireCount(cmd, 1, SIZE_MAX); break;
        case CommandKind::Info:      requireCount(cmd, 1, 1); break;
        case CommandKind::Duplicate: {
            requireCount(cmd, 1, 2);
            const bool makePrivate = vm["private"].as<bool>();
            const bool makePublic = vm["public"].as<bool>();
            if (makePrivate && makePublic) throw UsageError("--private and --public are mutually exclusive");
            if (makePrivate) cmd.visibility = Core::Transfer::Visibility::Private;
            if (makePublic) cmd.visibility = Core::Transfer::Visibility::Public;
            break;
        }
        default:
            break;
    }
    return cmd;
}

std::string usageText() {
    std::ostringstream out;
    out << "Usage: courier <command> [options] args...\n\n"
        << "Commands:\n"
        << "  cp SRC... DST [-r] [-m MSG]     Copy files, directories or wildcard matches\n"
        << "  mv SRC DST [-r] [-m MSG]        Move within one backend\n"
        << "  rm PATH... [-r] [-m MSG]        Delete paths\n"
        << "  info URI                        Show metadata for a path\n"
        << "  duplicate SRC [DST] [--private|--public] [-v]\n"
        << "                                  Duplicate a repository\n"
        << "  login, mount                    Provided by the external xet service\n\n"
        << "URIs are local paths or tag://path (file, memory, xet).\n"
        << "xet:// paths and duplicate need a repository backend registered by the host\n"
        << "application; the stock executable ships file and memory only.\n\n";
    out << globalOptions();
    out << commandOptions(CommandKind::Copy);
    out << commandOptions(CommandKind::Duplicate);
    return out.str();
}

} // namespace Courier::Tools
