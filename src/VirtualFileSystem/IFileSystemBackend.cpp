#include "IFileSystemBackend.h"
#include "GlobMatch.h"

namespace Courier::Core::IO {

FileOperationHandle IFileSystemBackend::glob(const std::string& pattern) {
    const auto slash = pattern.rfind('/');
    std::string parent = slash == std::string::npos ? std::string{} : pattern.substr(0, slash);
    const std::string namePattern = slash == std::string::npos ? pattern : pattern.substr(slash + 1);
    if (slash == 0) parent = "/";

    const std::string listRoot = parent.empty() ? rootKey() : parent;
    if (!exists(listRoot)) {
        return FileOperationHandle::withEntries({});
    }

    ListDirectoryOptions options;
    options.recursive = false;
    options.includeDirectories = true;
    auto listing = listDirectory(listRoot, options);
    listing.wait();
    if (listing.status() != FileOpStatus::Complete) {
        return listing;
    }

    std::vector<DirectoryEntry> matches;
    for (const auto& entry : listing.directoryEntries()) {
        if (!matchGlob(entry.name, namePattern)) continue;

        DirectoryEntry match = entry;
        if (parent.empty()) {
            match.fullPath = entry.name;
        } else if (parent == "/") {
            match.fullPath = "/" + entry.name;
        } else {
            match.fullPath = parent + "/" + entry.name;
        }
        match.metadata.path = match.fullPath;
        matches.push_back(std::move(match));
    }
    return FileOperationHandle::withEntries(std::move(matches));
}

} // namespace Courier::Core::IO
