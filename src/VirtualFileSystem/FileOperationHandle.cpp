#include "FileOperationHandle.h"

namespace Courier::Core::IO {

const char* toString(FileError error) noexcept {
    switch (error) {
        case FileError::None:         return "None";
        case FileError::FileNotFound: return "FileNotFound";
        case FileError::AccessDenied: return "AccessDenied";
        case FileError::DiskFull:     return "DiskFull";
        case FileError::InvalidPath:  return "InvalidPath";
        case FileError::IOError:      return "IOError";
        case FileError::NetworkError: return "NetworkError";
        case FileError::Timeout:      return "Timeout";
        case FileError::Conflict:     return "Conflict";
        case FileError::NotSupported: return "NotSupported";
        case FileError::Unknown:      return "Unknown";
    }
    return "Unknown";
}

void FileOperationHandle::wait() const {
    if (!_s) return;

    // Fast path - already complete
    if (_s->isComplete.load(std::memory_order_acquire)) {
        return;
    }

    std::unique_lock<std::mutex> lock(_s->completionMutex);
    _s->completionCV.wait(lock, [this] { return _s->isComplete.load(std::memory_order_acquire); });
}

FileOpStatus FileOperationHandle::status() const noexcept {
    return _s ? _s->st.load(std::memory_order_acquire) : FileOpStatus::Pending;
}

const FileErrorInfo& FileOperationHandle::errorInfo() const {
    static const FileErrorInfo emptyError;
    if (!_s) return emptyError;
    wait();
    return _s->error;
}

const std::optional<FileMetadata>& FileOperationHandle::metadata() const {
    static const std::optional<FileMetadata> empty;
    if (!_s) return empty;
    wait();
    return _s->metadata;
}

const std::vector<DirectoryEntry>& FileOperationHandle::directoryEntries() const {
    static const std::vector<DirectoryEntry> empty;
    if (!_s) return empty;
    wait();
    return _s->directoryEntries;
}

FileOperationHandle FileOperationHandle::immediate(FileOpStatus status) {
    auto state = makeState();
    state->complete(status);
    return FileOperationHandle(state);
}

FileOperationHandle FileOperationHandle::failure(FileError code, std::string message, std::string path,
                                                 std::optional<std::error_code> ec) {
    auto state = makeState();
    state->setError(code, message, path, ec);
    state->complete(FileOpStatus::Failed);
    return FileOperationHandle(state);
}

FileOperationHandle FileOperationHandle::withMetadata(FileMetadata metadata) {
    auto state = makeState();
    state->metadata = std::move(metadata);
    state->complete(FileOpStatus::Complete);
    return FileOperationHandle(state);
}

FileOperationHandle FileOperationHandle::withEntries(std::vector<DirectoryEntry> entries) {
    auto state = makeState();
    state->directoryEntries = std::move(entries);
    state->complete(FileOpStatus::Complete);
    return FileOperationHandle(state);
}

std::shared_ptr<FileOperationHandle::OpState> FileOperationHandle::makeState() {
    return std::make_shared<OpState>();
}

std::string describe(const FileErrorInfo& info) {
    std::string out = info.message.empty() ? toString(info.code) : info.message;
    if (!info.path.empty()) {
        out += " (" + info.path + ")";
    }
    if (info.systemError) {
        out += ": " + info.systemError->message();
    }
    return out;
}

} // namespace Courier::Core::IO
