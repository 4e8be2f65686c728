#include "Courier.h"
#include <filesystem>
#include <format>
#include <fstream>
#include <string>

using namespace Courier::Core;
using namespace Courier::Core::Concurrency;
using namespace Courier::Core::IO;
using namespace Courier::Core::Transfer;

static std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).generic_string();
}

static bool seed(const std::string& path, const std::string& contents) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
    return static_cast<bool>(out);
}

int main() {
    WorkService svc({});
    svc.start();
    PermitPool permits(8);

    auto registry = BackendRegistry::createDefault();
    TransferCoordinator coordinator(registry, permits, TransferConfig::fromEnvironment(), &svc);

    const auto root = tempPath("courier_copytree_src");
    if (!seed(root + "/notes.txt", std::string(4096, 'A')) ||
        !seed(root + "/data/points.csv", "x,y\n1,2\n") ||
        !seed(root + "/data/more/points2.csv", "x,y\n3,4\n")) {
        COURIER_LOG_ERROR("Seeding the source tree failed");
        svc.stop(); return 1;
    }

    // Local tree into the in-memory backend
    auto copied = coordinator.copy({root}, "memory://mirror", true);
    if (!copied.success) {
        COURIER_LOG_ERROR(std::format("Copy failed: {}", copied.message));
        svc.stop(); return 1;
    }
    COURIER_LOG_INFO(copied.message);

    // Only the csv files of one directory, flattened
    auto globbed = coordinator.copy({"memory://mirror/data/*.csv"}, "memory://flat", false);
    auto moved = coordinator.move("memory://flat", "memory://renamed", true);
    if (!globbed.success || !moved.success) {
        COURIER_LOG_ERROR(std::format("Glob or move failed: {} / {}", globbed.message, moved.message));
    }

    try {
        auto meta = coordinator.info("memory://renamed/points.csv");
        COURIER_LOG_INFO(std::format("points.csv is {} bytes", meta.size));
    } catch (const TransferError& e) {
        COURIER_LOG_ERROR(e.what());
    }

    auto removed = coordinator.remove({"memory://mirror", "memory://renamed"}, true);
    if (!removed.success) {
        COURIER_LOG_WARNING(removed.message);
    }

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    svc.stop();
    return 0;
}
