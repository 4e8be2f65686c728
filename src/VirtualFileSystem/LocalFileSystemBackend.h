#pragma once
#include "IFileSystemBackend.h"
#include <functional>

namespace Courier::Core::IO {

/**
 * Backend over the host filesystem. Registered under the `file` tag (alias `local`);
 * paths are native paths, absolute or relative to the working directory.
 */
class LocalFileSystemBackend : public IFileSystemBackend {
public:
    LocalFileSystemBackend() = default;
    ~LocalFileSystemBackend() override = default;

    // Metadata operations
    FileOperationHandle getMetadata(const std::string& path) override;
    bool exists(const std::string& path) override;

    // Directory operations
    FileOperationHandle createDirectory(const std::string& path) override;
    FileOperationHandle listDirectory(const std::string& path, ListDirectoryOptions options = {}) override;

    // Stream support
    std::unique_ptr<FileStream> openStream(const std::string& path, StreamOptions options = {}) override;

    FileOperationHandle moveFile(const std::string& src, const std::string& dst) override;
    FileOperationHandle remove(const std::string& path, bool recursive = false) override;

    // Backend info
    BackendCapabilities getCapabilities() const override;
    std::string getBackendType() const override { return "LocalFileSystem"; }
    std::vector<std::string> protocols() const override { return {"file", "local"}; }

private:
    // Runs the operation on the calling thread and returns the completed handle
    FileOperationHandle submitWork(const std::string& path,
                                   const std::function<void(FileOperationHandle::OpState&, const std::string&)>& work);
};

} // namespace Courier::Core::IO
