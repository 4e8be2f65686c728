#include "LocalFileSystemBackend.h"
#include "FileStream.h"
#include "GlobMatch.h"
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <cerrno>

namespace Courier::Core::IO {

namespace {
    // errno from a failed stream write
    FileError errnoToFileError(int err) {
        switch (err) {
            case ENOSPC:
#if defined(__unix__) || defined(__APPLE__)
            case EDQUOT:
#endif
                return FileError::DiskFull;
            case EACCES:
            case EPERM:
                return FileError::AccessDenied;
            case ENOENT:
                return FileError::FileNotFound;
            case EINVAL:
            case ENAMETOOLONG:
            case EISDIR:
            case ENOTDIR:
                return FileError::InvalidPath;
            case EEXIST:
            case ENOTEMPTY:
                return FileError::Conflict;
            default:
                return FileError::IOError;
        }
    }

    FileMetadata statEntry(const std::filesystem::path& p, const std::filesystem::file_status& status) {
        std::error_code ec;
        FileMetadata meta;
        meta.path = p.string();
        meta.exists = std::filesystem::exists(status);
        if (!meta.exists) return meta;

        std::error_code ssec;
        auto ss = std::filesystem::symlink_status(p, ssec);
        meta.isSymlink = !ssec && std::filesystem::is_symlink(ss);
        meta.isDirectory = std::filesystem::is_directory(status);
        meta.isRegularFile = std::filesystem::is_regular_file(status);

        if (meta.isRegularFile) {
            meta.size = std::filesystem::file_size(p, ec);
            if (ec) meta.size = 0;
        }

        auto lwt = std::filesystem::last_write_time(p, ec);
        if (!ec) {
            // file_time_type has an unspecified epoch; shift through now()
            meta.lastModified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                lwt - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
        }
        return meta;
    }

    bool isDotEntry(const std::string& name) {
        return !name.empty() && name[0] == '.';
    }
}

class DiskStream : public FileStream {
private:
    mutable std::fstream _stream;
    std::string _path;
    StreamOptions::Mode _mode;
    bool _failFlag = false;

public:
    DiskStream(const std::string& path, StreamOptions options)
        : _path(path), _mode(options.mode) {
        std::ios_base::openmode flags = std::ios::binary;

        if (_mode == StreamOptions::Read) {
            flags |= std::ios::in;
            std::error_code ec;
            if (std::filesystem::is_directory(path, ec)) {
                _failFlag = true;
                return;
            }
        } else {
            flags |= std::ios::out | std::ios::trunc;
            if (options.createParentDirs) {
                std::error_code ec;
                const auto parent = std::filesystem::path(path).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent, ec);
                    if (ec) {
                        _failFlag = true;
                        return;
                    }
                }
            }
        }

        _stream.open(path, flags);
        if (!_stream.is_open()) {
            _failFlag = true;
        }
    }

    ~DiskStream() override {
        if (_stream.is_open()) {
            _stream.close();
        }
    }

    IoResult read(std::span<std::byte> buffer) override {
        IoResult result;

        if (_failFlag || _stream.bad() || _mode != StreamOptions::Read) {
            result.error = FileError::IOError;
            return result;
        }
        if (_stream.eof() || buffer.empty()) {
            result.complete = true;
            return result;
        }

        _stream.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        result.bytesTransferred = static_cast<size_t>(_stream.gcount());
        result.complete = (result.bytesTransferred == buffer.size()) || _stream.eof();

        if (_stream.bad()) {
            result.error = FileError::IOError;
        }

        return result;
    }

    IoResult write(std::span<const std::byte> data) override {
        IoResult result;

        if (!good() || _mode != StreamOptions::Write) {
            result.error = FileError::IOError;
            return result;
        }
        if (data.empty()) {
            result.complete = true;
            return result;
        }

        _stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));

        if (_stream.good()) {
            result.bytesTransferred = data.size();
            result.complete = true;
        } else {
            result.error = errnoToFileError(errno);
        }

        return result;
    }

    bool good() const override { return _stream.good() && !_failFlag; }
    bool eof() const override { return _stream.eof(); }
    bool fail() const override { return _failFlag || (_mode == StreamOptions::Write ? _stream.fail() : _stream.bad()); }
    void flush() override { _stream.flush(); }
    void close() override {
        if (!_stream.is_open()) return;
        _stream.flush();
        if (_stream.fail() && _mode == StreamOptions::Write) _failFlag = true;
        _stream.close();
        if (_stream.fail() && _mode == StreamOptions::Write) _failFlag = true;
    }
    std::string path() const override { return _path; }
};

FileOperationHandle LocalFileSystemBackend::submitWork(
    const std::string& path,
    const std::function<void(FileOperationHandle::OpState&, const std::string&)>& work) {
    auto state = FileOperationHandle::makeState();
    state->st.store(FileOpStatus::Running, std::memory_order_release);
    try {
        work(*state, path);
    } catch (const std::filesystem::filesystem_error& e) {
        state->setError(errnoToFileError(e.code().value()), e.what(), path, e.code());
        state->complete(FileOpStatus::Failed);
    } catch (const std::bad_alloc&) {
        state->setError(FileError::IOError, "Out of memory", path);
        state->complete(FileOpStatus::Failed);
    }
    return FileOperationHandle(state);
}

FileOperationHandle LocalFileSystemBackend::getMetadata(const std::string& path) {
    return submitWork(path, [](FileOperationHandle::OpState& s, const std::string& p) {
        std::error_code ec;
        auto status = std::filesystem::status(p, ec);
        if (ec || !std::filesystem::exists(status)) {
            s.setError(FileError::FileNotFound, "No such file or directory", p, ec ? std::optional(ec) : std::nullopt);
            s.complete(FileOpStatus::Failed);
            return;
        }

        s.metadata = statEntry(p, status);
        s.complete(FileOpStatus::Complete);
    });
}

bool LocalFileSystemBackend::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

FileOperationHandle LocalFileSystemBackend::createDirectory(const std::string& path) {
    return submitWork(path, [](FileOperationHandle::OpState& s, const std::string& p) {
        std::error_code ec;
        std::filesystem::create_directories(p, ec);

        if (ec) {
            s.setError(errnoToFileError(ec.value()), "Cannot create directory", p, ec);
            s.complete(FileOpStatus::Failed);
        } else if (!std::filesystem::is_directory(p, ec)) {
            s.setError(FileError::InvalidPath, "Path exists and is not a directory", p);
            s.complete(FileOpStatus::Failed);
        } else {
            s.complete(FileOpStatus::Complete);
        }
    });
}

FileOperationHandle LocalFileSystemBackend::listDirectory(const std::string& path, ListDirectoryOptions options) {
    return submitWork(path, [options](FileOperationHandle::OpState& s, const std::string& p) {
        std::vector<DirectoryEntry> entries;
        std::error_code ec;

        // Fail fast if directory does not exist
        if (!std::filesystem::is_directory(p, ec)) {
            s.setError(FileError::FileNotFound, "Directory not found", p, ec ? std::optional(ec) : std::nullopt);
            s.complete(FileOpStatus::Failed);
            return;
        }

        auto populateEntry = [&](const std::filesystem::directory_entry& fsEntry) {
            DirectoryEntry entry;
            entry.name = fsEntry.path().filename().string();
            entry.fullPath = fsEntry.path().string();

            std::error_code sec;
            auto status = fsEntry.status(sec);
            if (sec) return;  // Skip this entry but continue

            entry.metadata = statEntry(fsEntry.path(), status);

            if (entry.metadata.isDirectory && !options.includeDirectories) return;
            if (options.globPattern && !matchGlob(entry.name, *options.globPattern)) return;

            entries.push_back(std::move(entry));
        };

        if (options.recursive) {
            auto dirOptions = std::filesystem::directory_options::skip_permission_denied;
            std::filesystem::recursive_directory_iterator it(p, dirOptions, ec);
            for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
                const auto name = it->path().filename().string();
                if (!options.includeHidden && isDotEntry(name)) {
                    if (it->is_directory()) it.disable_recursion_pending();
                    continue;
                }
                populateEntry(*it);
            }
        } else {
            for (const auto& fsEntry : std::filesystem::directory_iterator(p, ec)) {
                if (!options.includeHidden && isDotEntry(fsEntry.path().filename().string())) continue;
                populateEntry(fsEntry);
            }
        }

        if (ec) {
            s.setError(errnoToFileError(ec.value()), "Cannot iterate directory", p, ec);
            s.complete(FileOpStatus::Failed);
            return;
        }

        std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
            return a.fullPath < b.fullPath;
        });

        s.directoryEntries = std::move(entries);
        s.complete(FileOpStatus::Complete);
    });
}

std::unique_ptr<FileStream> LocalFileSystemBackend::openStream(const std::string& path, StreamOptions options) {
    return std::make_unique<DiskStream>(path, options);
}

FileOperationHandle LocalFileSystemBackend::moveFile(const std::string& src, const std::string& dst) {
    return submitWork(src, [dst](FileOperationHandle::OpState& s, const std::string& from) {
        std::error_code ec;

        if (!std::filesystem::exists(from, ec) || ec) {
            s.setError(FileError::FileNotFound, "Source not found", from, ec ? std::optional(ec) : std::nullopt);
            s.complete(FileOpStatus::Failed);
            return;
        }

        // Ensure destination parent directory exists
        const auto parent = std::filesystem::path(dst).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                s.setError(errnoToFileError(ec.value()), "Failed to create destination parent directories", dst, ec);
                s.complete(FileOpStatus::Failed);
                return;
            }
        }

        // Try rename first (atomic if on same filesystem)
        std::filesystem::rename(from, dst, ec);
        if (!ec) {
            s.complete(FileOpStatus::Complete);
            return;
        }

        // Rename failed (likely cross-filesystem) - do copy + delete
        ec.clear();
        std::filesystem::copy(from, dst,
                              std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            s.setError(errnoToFileError(ec.value()), "Copy failed during move", from, ec);
            s.complete(FileOpStatus::Failed);
            return;
        }

        std::filesystem::remove_all(from, ec);
        if (ec) {
            // Copy succeeded but delete failed - partial success
            s.setError(errnoToFileError(ec.value()), "Source deletion failed after copy", from, ec);
            s.complete(FileOpStatus::Partial);
            return;
        }

        s.complete(FileOpStatus::Complete);
    });
}

FileOperationHandle LocalFileSystemBackend::remove(const std::string& path, bool recursive) {
    return submitWork(path, [recursive](FileOperationHandle::OpState& s, const std::string& p) {
        std::error_code ec;
        auto status = std::filesystem::symlink_status(p, ec);
        if (ec || !std::filesystem::exists(status)) {
            s.setError(FileError::FileNotFound, "No such file or directory", p);
            s.complete(FileOpStatus::Failed);
            return;
        }

        if (std::filesystem::is_directory(status)) {
            if (recursive) {
                std::filesystem::remove_all(p, ec);
            } else {
                std::filesystem::remove(p, ec);
            }
        } else {
            std::filesystem::remove(p, ec);
        }

        if (ec) {
            s.setError(errnoToFileError(ec.value()), "Cannot remove path", p, ec);
            s.complete(FileOpStatus::Failed);
        } else {
            s.complete(FileOpStatus::Complete);
        }
    });
}

BackendCapabilities LocalFileSystemBackend::getCapabilities() const {
    return {};
}

} // namespace Courier::Core::IO
