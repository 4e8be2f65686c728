/**
 * @file IFileSystemBackend.h
 * @brief Backend interface for storage addressed by a protocol tag
 *
 * Implementations provide concrete file operations (local filesystem, in-memory store, remote
 * content-addressed stores). The transfer layer resolves a URI to a backend by its tag and only
 * talks to it through this interface. Backends with versioned-repository semantics additionally
 * implement ITransactionalBackend and expose it through asTransactional().
 */
#pragma once
#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>
#include "FileOperationHandle.h"

namespace Courier::Core::IO {

// Forward declarations
class FileStream;
class ITransactionalBackend;

/**
 * @brief Options for opening streams
 * @param mode Access mode (read/write)
 * @param createParentDirs Create missing parent directories when opening for write
 */
struct StreamOptions {
    enum Mode { Read, Write };
    Mode mode = Read;
    bool createParentDirs = true;
};

/**
 * @brief Capabilities advertised by a backend
 * @note Content-addressed backends get server-side copies, dedup hints and branch checks
 */
struct BackendCapabilities {
    bool isContentAddressed = false;
};

/**
 * @brief Options controlling directory listings
 * @param recursive If true, recurse into subdirectories
 * @param includeDirectories Report directory entries alongside files
 * @param includeHidden Include dot-files and dot-directories
 * @param globPattern Optional filter applied to entry names (*.txt, file?.dat, etc)
 */
struct ListDirectoryOptions {
    bool recursive = false;
    bool includeDirectories = true;
    bool includeHidden = true;
    std::optional<std::string> globPattern;
};

// Backend interface
class IFileSystemBackend {
public:
    virtual ~IFileSystemBackend() = default;

    // Backend info
    virtual BackendCapabilities getCapabilities() const = 0;
    virtual std::string getBackendType() const = 0;

    /**
     * @brief Protocol tags this backend answers to
     *
     * The first entry is the canonical tag. A backend can be reached under any of its aliases;
     * the transfer layer records the tag it was requested with.
     */
    virtual std::vector<std::string> protocols() const = 0;

    // Metadata operations
    /**
     * @brief Retrieves metadata for a path
     * @return Handle whose metadata() is populated after wait(); FileNotFound when absent
     */
    virtual FileOperationHandle getMetadata(const std::string& path) = 0;
    virtual bool exists(const std::string& path) = 0;

    virtual bool isDirectory(const std::string& path) {
        auto h = getMetadata(path);
        h.wait();
        return h.status() == FileOpStatus::Complete && h.metadata() && h.metadata()->isDirectory;
    }

    // Stream support
    /**
     * @brief Opens a stream for the given path
     * @param path Target path
     * @param options StreamOptions (mode, parent directory creation)
     * @return Unique pointer to FileStream, or null on failure
     */
    virtual std::unique_ptr<FileStream> openStream(const std::string& path, StreamOptions options = {}) = 0;

    // Directory operations
    /**
     * @brief Lists entries under the given directory
     *
     * With options.recursive the listing covers the whole subtree (files and, when
     * includeDirectories is set, every nested directory) keyed by fullPath.
     */
    virtual FileOperationHandle listDirectory(const std::string& path, ListDirectoryOptions options = {}) = 0;

    /**
     * @brief Expands a pattern whose wildcards sit in the final segment
     *
     * Default implementation lists the parent directory and filters names with matchGlob().
     * A pattern without a directory part lists rootKey(). A parent that does not exist yields
     * an empty, successful result.
     */
    virtual FileOperationHandle glob(const std::string& pattern);

    /**
     * @brief Creates a directory and any missing parents; succeeds when it already exists
     */
    virtual FileOperationHandle createDirectory(const std::string& path) = 0;

    virtual FileOperationHandle moveFile(const std::string& src, const std::string& dst) = 0;

    /**
     * @brief Removes a file, or a directory tree when recursive is set
     */
    virtual FileOperationHandle remove(const std::string& path, bool recursive = false) = 0;

    // Capability query; non-null only for backends with branch and transaction semantics
    virtual ITransactionalBackend* asTransactional() { return nullptr; }

    // Directory listed for a glob with no directory part
    virtual std::string rootKey() const { return "."; }
};

} // namespace Courier::Core::IO
