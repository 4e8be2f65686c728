#pragma once
#include "IFileSystemBackend.h"
#include <map>
#include <set>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace Courier::Core::IO {

/**
 * @brief Process-local, thread-safe filesystem held in memory
 *
 * Registered under the `memory` tag (alias `mem`). Paths are normalized to absolute,
 * slash-separated form, so `memory://a/b` and `memory:///a/b` name the same object.
 * Written data becomes visible when the write stream is closed.
 */
class MemoryFileSystemBackend : public IFileSystemBackend {
public:
    MemoryFileSystemBackend();
    ~MemoryFileSystemBackend() override = default;

    FileOperationHandle getMetadata(const std::string& path) override;
    bool exists(const std::string& path) override;

    FileOperationHandle createDirectory(const std::string& path) override;
    FileOperationHandle listDirectory(const std::string& path, ListDirectoryOptions options = {}) override;

    std::unique_ptr<FileStream> openStream(const std::string& path, StreamOptions options = {}) override;

    FileOperationHandle moveFile(const std::string& src, const std::string& dst) override;
    FileOperationHandle remove(const std::string& path, bool recursive = false) override;

    BackendCapabilities getCapabilities() const override;
    std::string getBackendType() const override { return "MemoryFileSystem"; }
    std::vector<std::string> protocols() const override { return {"memory", "mem"}; }

    std::string rootKey() const override { return "/"; }

    // Absolute, slash-separated key with duplicate and trailing slashes removed
    std::string normalizeKey(const std::string& path) const;

    // Convenience accessors for seeding and inspection
    void putFile(const std::string& path, std::string_view contents);
    std::optional<std::string> readFile(const std::string& path) const;
    size_t fileCount() const;

private:
    friend class MemoryFileStream;

    using Blob = std::shared_ptr<const std::vector<std::byte>>;

    bool commitFile(const std::string& key, std::vector<std::byte> data, bool createParents);
    void addParentsLocked(const std::string& key);
    bool isDirectoryLocked(const std::string& key) const;
    bool fileOnParentChainLocked(const std::string& key) const;

    mutable std::shared_mutex _mutex;
    std::map<std::string, Blob> _files;
    std::set<std::string> _directories;
};

} // namespace Courier::Core::IO
