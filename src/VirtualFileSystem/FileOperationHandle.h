#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace Courier::Core::IO {

enum class FileOpStatus { Pending, Running, Partial, Complete, Failed };

/**
 * Public error taxonomy surfaced by backend operations.
 * Mapping guidelines:
 * - FileNotFound: path (or branch) does not exist when required
 * - AccessDenied: open/create denied by OS/permissions or by the remote service
 * - DiskFull: ENOSPC/EDQUOT or equivalent on write/flush
 * - InvalidPath: malformed path, name too long, or wrong entry type
 * - IOError: other local I/O failures
 * - NetworkError: remote/backend transport failure
 * - Conflict: transaction state or destination conflict
 * - NotSupported: capability not offered by this backend
 */
enum class FileError {
    None = 0,
    FileNotFound,
    AccessDenied,
    DiskFull,
    InvalidPath,
    IOError,
    NetworkError,
    Timeout,
    Conflict,
    NotSupported,
    Unknown
};

const char* toString(FileError error) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;
};

// Metadata reported by info() and by listings
struct FileMetadata {
    std::string path;
    bool exists = false;
    bool isDirectory = false;
    bool isRegularFile = false;
    bool isSymlink = false;
    uintmax_t size = 0;
    std::optional<std::chrono::system_clock::time_point> lastModified;
};

// Listing entry; fullPath is in the backend's own path space
struct DirectoryEntry {
    std::string name;
    std::string fullPath;
    FileMetadata metadata;
};

/**
 * @brief Completion handle for a backend operation
 *
 * Backends either complete the handle before returning (LocalFileSystemBackend,
 * MemoryFileSystemBackend) or complete it later from another thread. Accessors wait for
 * completion first, so callers can read results directly.
 */
class FileOperationHandle {
public:
    FileOperationHandle() = default;

    void wait() const;
    FileOpStatus status() const noexcept;
    bool succeeded() const { wait(); return status() == FileOpStatus::Complete; }

    const std::optional<FileMetadata>& metadata() const;
    const std::vector<DirectoryEntry>& directoryEntries() const;
    const FileErrorInfo& errorInfo() const;

    // Factories for immediate completion (no async work needed)
    static FileOperationHandle immediate(FileOpStatus status);
    static FileOperationHandle failure(FileError code, std::string message, std::string path = {},
                                       std::optional<std::error_code> ec = std::nullopt);
    static FileOperationHandle withMetadata(FileMetadata metadata);
    static FileOperationHandle withEntries(std::vector<DirectoryEntry> entries);

    struct OpState {
        std::atomic<FileOpStatus> st{FileOpStatus::Pending};
        mutable std::mutex completionMutex;
        mutable std::condition_variable completionCV;
        std::atomic<bool> isComplete{false};

        // Result data - only valid after completion
        FileErrorInfo error;
        std::optional<FileMetadata> metadata;
        std::vector<DirectoryEntry> directoryEntries;

        void complete(FileOpStatus final) noexcept {
            {
                std::lock_guard<std::mutex> lock(completionMutex);
                st.store(final, std::memory_order_release);
                isComplete.store(true, std::memory_order_release);
            }
            completionCV.notify_all();
        }

        void setError(FileError code, const std::string& msg,
                      const std::string& path = "",
                      std::optional<std::error_code> ec = std::nullopt) {
            error.code = code;
            error.message = msg;
            error.path = path;
            error.systemError = ec;
        }
    };

    // For backends completing work asynchronously
    static std::shared_ptr<OpState> makeState();
    explicit FileOperationHandle(std::shared_ptr<OpState> s) : _s(std::move(s)) {}

private:
    std::shared_ptr<OpState> _s;
};

// Formats "message (path)" plus the system error when present
std::string describe(const FileErrorInfo& info);

} // namespace Courier::Core::IO
