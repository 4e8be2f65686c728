#include "MemoryFileSystemBackend.h"
#include "FileStream.h"
#include "GlobMatch.h"
#include <algorithm>
#include <cstring>
#include <mutex>

namespace Courier::Core::IO {

namespace {
    std::string parentKey(const std::string& key) {
        auto slash = key.rfind('/');
        if (slash == std::string::npos || slash == 0) return "/";
        return key.substr(0, slash);
    }

    std::string leafName(const std::string& key) {
        auto slash = key.rfind('/');
        return slash == std::string::npos ? key : key.substr(slash + 1);
    }

    // Re-expresses a key below dirKey in the caller's spelling of the directory
    std::string relativeToRequest(const std::string& request, const std::string& dirKey, const std::string& key) {
        std::string base = request;
        while (base.size() > 1 && base.back() == '/') base.pop_back();
        std::string suffix = dirKey == "/" ? key.substr(1) : key.substr(dirKey.size() + 1);
        if (base.empty()) return suffix;
        if (base == "/") return "/" + suffix;
        return base + "/" + suffix;
    }

    bool hasHiddenSegment(const std::string& relative) {
        size_t start = 0;
        while (start < relative.size()) {
            if (relative[start] == '.') return true;
            auto next = relative.find('/', start);
            if (next == std::string::npos) break;
            start = next + 1;
        }
        return false;
    }
}

class MemoryFileStream : public FileStream {
public:
    MemoryFileStream(MemoryFileSystemBackend& owner, std::string key, std::string requested,
                     StreamOptions options, std::shared_ptr<const std::vector<std::byte>> contents)
        : _owner(owner), _key(std::move(key)), _requested(std::move(requested)), _options(options),
          _contents(std::move(contents)) {
        if (_options.mode == StreamOptions::Read && !_contents) {
            _failFlag = true;
        }
    }

    ~MemoryFileStream() override {
        close();
    }

    IoResult read(std::span<std::byte> buffer) override {
        IoResult result;
        if (_failFlag || _options.mode != StreamOptions::Read) {
            result.error = FileError::IOError;
            return result;
        }
        const size_t available = _contents->size() - std::min(_position, _contents->size());
        const size_t toCopy = std::min(available, buffer.size());
        if (toCopy > 0) {
            std::memcpy(buffer.data(), _contents->data() + _position, toCopy);
        }
        _position += toCopy;
        _eof = _position >= _contents->size();
        result.bytesTransferred = toCopy;
        result.complete = true;
        return result;
    }

    IoResult write(std::span<const std::byte> data) override {
        IoResult result;
        if (!good() || _options.mode != StreamOptions::Write) {
            result.error = FileError::IOError;
            return result;
        }
        if (_position + data.size() > _pending.size()) {
            _pending.resize(_position + data.size());
        }
        std::memcpy(_pending.data() + _position, data.data(), data.size());
        _position += data.size();
        result.bytesTransferred = data.size();
        result.complete = true;
        return result;
    }

    bool good() const override { return !_failFlag && !_closed && !_eof; }
    bool eof() const override { return _eof; }
    bool fail() const override { return _failFlag; }
    void flush() override {}

    void close() override {
        if (_closed) return;
        _closed = true;
        if (_options.mode == StreamOptions::Write && !_failFlag) {
            if (!_owner.commitFile(_key, std::move(_pending), _options.createParentDirs)) {
                _failFlag = true;
            }
        }
    }

    std::string path() const override { return _requested; }

private:
    MemoryFileSystemBackend& _owner;
    std::string _key;
    std::string _requested;
    StreamOptions _options;
    std::shared_ptr<const std::vector<std::byte>> _contents;
    std::vector<std::byte> _pending;
    size_t _position = 0;
    bool _eof = false;
    bool _closed = false;
    bool _failFlag = false;
};

MemoryFileSystemBackend::MemoryFileSystemBackend() {
    _directories.insert("/");
}

std::string MemoryFileSystemBackend::normalizeKey(const std::string& path) const {
    std::string key;
    key.reserve(path.size() + 1);
    key.push_back('/');
    for (char c : path) {
        if (c == '/' && key.back() == '/') continue;
        key.push_back(c);
    }
    while (key.size() > 1 && key.back() == '/') key.pop_back();
    return key;
}

void MemoryFileSystemBackend::addParentsLocked(const std::string& key) {
    std::string parent = parentKey(key);
    while (_directories.insert(parent).second && parent != "/") {
        parent = parentKey(parent);
    }
}

bool MemoryFileSystemBackend::isDirectoryLocked(const std::string& key) const {
    return _directories.count(key) > 0;
}

bool MemoryFileSystemBackend::fileOnParentChainLocked(const std::string& key) const {
    for (std::string parent = parentKey(key); parent != "/"; parent = parentKey(parent)) {
        if (_files.count(parent) > 0) return true;
    }
    return false;
}

bool MemoryFileSystemBackend::commitFile(const std::string& key, std::vector<std::byte> data, bool createParents) {
    std::unique_lock lock(_mutex);
    if (isDirectoryLocked(key)) return false;
    if (fileOnParentChainLocked(key)) return false;
    const auto parent = parentKey(key);
    if (!isDirectoryLocked(parent)) {
        if (!createParents) return false;
        addParentsLocked(key);
    }
    _files[key] = std::make_shared<std::vector<std::byte>>(std::move(data));
    return true;
}

FileOperationHandle MemoryFileSystemBackend::getMetadata(const std::string& path) {
    const auto key = normalizeKey(path);
    std::shared_lock lock(_mutex);

    FileMetadata meta;
    meta.path = path;
    if (auto it = _files.find(key); it != _files.end()) {
        meta.exists = true;
        meta.isRegularFile = true;
        meta.size = it->second->size();
        return FileOperationHandle::withMetadata(std::move(meta));
    }
    if (isDirectoryLocked(key)) {
        meta.exists = true;
        meta.isDirectory = true;
        return FileOperationHandle::withMetadata(std::move(meta));
    }
    return FileOperationHandle::failure(FileError::FileNotFound, "No such file or directory", path);
}

bool MemoryFileSystemBackend::exists(const std::string& path) {
    const auto key = normalizeKey(path);
    std::shared_lock lock(_mutex);
    return _files.count(key) > 0 || isDirectoryLocked(key);
}

FileOperationHandle MemoryFileSystemBackend::createDirectory(const std::string& path) {
    const auto key = normalizeKey(path);
    std::unique_lock lock(_mutex);

    // A file anywhere along the chain blocks creation
    for (std::string ancestor = key; ; ancestor = parentKey(ancestor)) {
        if (_files.count(ancestor) > 0) {
            return FileOperationHandle::failure(FileError::InvalidPath, "Path exists and is not a directory", path);
        }
        if (ancestor == "/") break;
    }
    _directories.insert(key);
    addParentsLocked(key);
    return FileOperationHandle::immediate(FileOpStatus::Complete);
}

FileOperationHandle MemoryFileSystemBackend::listDirectory(const std::string& path, ListDirectoryOptions options) {
    const auto dirKey = normalizeKey(path);
    std::shared_lock lock(_mutex);

    if (!isDirectoryLocked(dirKey)) {
        return FileOperationHandle::failure(FileError::FileNotFound, "Directory not found", path);
    }

    const std::string prefix = dirKey == "/" ? "/" : dirKey + "/";
    std::vector<DirectoryEntry> entries;

    auto consider = [&](const std::string& key, bool isDir, uintmax_t size) {
        if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) return;
        const std::string relative = key.substr(prefix.size());
        if (!options.recursive && relative.find('/') != std::string::npos) return;
        if (!options.includeHidden && hasHiddenSegment(relative)) return;
        if (isDir && !options.includeDirectories) return;

        DirectoryEntry entry;
        entry.name = leafName(key);
        if (options.globPattern && !matchGlob(entry.name, *options.globPattern)) return;
        entry.fullPath = relativeToRequest(path, dirKey, key);
        entry.metadata.path = entry.fullPath;
        entry.metadata.exists = true;
        entry.metadata.isDirectory = isDir;
        entry.metadata.isRegularFile = !isDir;
        entry.metadata.size = size;
        entries.push_back(std::move(entry));
    };

    for (auto it = _directories.lower_bound(prefix); it != _directories.end(); ++it) {
        if (it->compare(0, prefix.size(), prefix) != 0) break;
        consider(*it, true, 0);
    }
    for (auto it = _files.lower_bound(prefix); it != _files.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        consider(it->first, false, it->second->size());
    }

    std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
        return a.fullPath < b.fullPath;
    });
    return FileOperationHandle::withEntries(std::move(entries));
}

std::unique_ptr<FileStream> MemoryFileSystemBackend::openStream(const std::string& path, StreamOptions options) {
    const auto key = normalizeKey(path);
    Blob contents;
    if (options.mode == StreamOptions::Read) {
        std::shared_lock lock(_mutex);
        if (auto it = _files.find(key); it != _files.end()) {
            contents = it->second;
        }
    }
    return std::make_unique<MemoryFileStream>(*this, key, path, options, std::move(contents));
}

FileOperationHandle MemoryFileSystemBackend::moveFile(const std::string& src, const std::string& dst) {
    const auto from = normalizeKey(src);
    const auto to = normalizeKey(dst);
    std::unique_lock lock(_mutex);

    if (fileOnParentChainLocked(to)) {
        return FileOperationHandle::failure(FileError::InvalidPath, "Destination parent is not a directory", dst);
    }

    if (auto it = _files.find(from); it != _files.end()) {
        if (isDirectoryLocked(to)) {
            return FileOperationHandle::failure(FileError::Conflict, "Destination is a directory", dst);
        }
        auto blob = it->second;
        _files.erase(it);
        _files[to] = std::move(blob);
        addParentsLocked(to);
        return FileOperationHandle::immediate(FileOpStatus::Complete);
    }

    if (!isDirectoryLocked(from) || from == "/") {
        return FileOperationHandle::failure(FileError::FileNotFound, "Source not found", src);
    }
    if (to.compare(0, from.size() + 1, from + "/") == 0) {
        return FileOperationHandle::failure(FileError::InvalidPath, "Cannot move a directory into itself", dst);
    }
    if (_files.count(to) > 0) {
        return FileOperationHandle::failure(FileError::Conflict, "Destination is a file", dst);
    }

    const std::string prefix = from + "/";
    std::map<std::string, Blob> movedFiles;
    for (auto it = _files.lower_bound(prefix); it != _files.end() && it->first.compare(0, prefix.size(), prefix) == 0;) {
        movedFiles[to + it->first.substr(from.size())] = it->second;
        it = _files.erase(it);
    }
    std::set<std::string> movedDirs{to};
    for (auto it = _directories.lower_bound(prefix); it != _directories.end() && it->compare(0, prefix.size(), prefix) == 0;) {
        movedDirs.insert(to + it->substr(from.size()));
        it = _directories.erase(it);
    }
    _directories.erase(from);

    for (auto& [key, blob] : movedFiles) _files[key] = std::move(blob);
    _directories.insert(movedDirs.begin(), movedDirs.end());
    addParentsLocked(to);
    return FileOperationHandle::immediate(FileOpStatus::Complete);
}

FileOperationHandle MemoryFileSystemBackend::remove(const std::string& path, bool recursive) {
    const auto key = normalizeKey(path);
    std::unique_lock lock(_mutex);

    if (_files.erase(key) > 0) {
        return FileOperationHandle::immediate(FileOpStatus::Complete);
    }
    if (!isDirectoryLocked(key)) {
        return FileOperationHandle::failure(FileError::FileNotFound, "No such file or directory", path);
    }

    const std::string prefix = key == "/" ? "/" : key + "/";
    auto firstFile = _files.lower_bound(prefix);
    auto firstDir = _directories.lower_bound(prefix);
    const bool empty = (firstFile == _files.end() || firstFile->first.compare(0, prefix.size(), prefix) != 0) &&
                       (firstDir == _directories.end() || firstDir->compare(0, prefix.size(), prefix) != 0);
    if (!empty && !recursive) {
        return FileOperationHandle::failure(FileError::Conflict, "Directory not empty", path);
    }

    while (firstFile != _files.end() && firstFile->first.compare(0, prefix.size(), prefix) == 0) {
        firstFile = _files.erase(firstFile);
    }
    while (firstDir != _directories.end() && firstDir->compare(0, prefix.size(), prefix) == 0) {
        firstDir = _directories.erase(firstDir);
    }
    if (key != "/") _directories.erase(key);
    return FileOperationHandle::immediate(FileOpStatus::Complete);
}

BackendCapabilities MemoryFileSystemBackend::getCapabilities() const {
    return {};
}

void MemoryFileSystemBackend::putFile(const std::string& path, std::string_view contents) {
    std::vector<std::byte> data(contents.size());
    if (!contents.empty()) std::memcpy(data.data(), contents.data(), contents.size());
    const auto key = normalizeKey(path);
    std::unique_lock lock(_mutex);
    _files[key] = std::make_shared<std::vector<std::byte>>(std::move(data));
    addParentsLocked(key);
}

std::optional<std::string> MemoryFileSystemBackend::readFile(const std::string& path) const {
    const auto key = normalizeKey(path);
    std::shared_lock lock(_mutex);
    auto it = _files.find(key);
    if (it == _files.end()) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(it->second->data()), it->second->size());
}

size_t MemoryFileSystemBackend::fileCount() const {
    std::shared_lock lock(_mutex);
    return _files.size();
}

} // namespace Courier::Core::IO
