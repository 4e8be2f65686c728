/**
 * @file ITransactionalBackend.h
 * @brief Extension interface for versioned, content-addressed repository backends
 *
 * Paths handed to these operations are in the backend's own path space, of the form
 * `user/repo/branch/path/inside/branch`. All mutations between beginTransaction() and
 * endTransaction() land as a single commit; abortTransaction() discards them.
 */
#pragma once
#include <string>
#include "IFileSystemBackend.h"

namespace Courier::Core::IO {

struct BranchInfo {
    std::string user;
    std::string repository;
    std::string branch;
    std::string head;   // commit identifier, empty if the backend does not report one
};

class ITransactionalBackend : public IFileSystemBackend {
public:
    ITransactionalBackend* asTransactional() override { return this; }

    // Transactions
    virtual FileOperationHandle beginTransaction(const std::string& commitMessage) = 0;
    virtual FileOperationHandle endTransaction() = 0;
    virtual FileOperationHandle abortTransaction() = 0;
    virtual bool inTransaction() const = 0;

    /**
     * @brief Looks up the branch a path lives on
     * @return Handle that fails with FileNotFound when the repository or branch is absent
     */
    virtual FileOperationHandle branchInfo(const std::string& path, BranchInfo* out = nullptr) = 0;

    // True for directories and for branch roots (`user/repo/branch`)
    virtual bool isDirectoryOrBranch(const std::string& path) = 0;

    // Native server-side copies; no data flows through the client
    virtual FileOperationHandle copyFile(const std::string& src, const std::string& dst) = 0;
    virtual FileOperationHandle copyDirectory(const std::string& src, const std::string& dst) = 0;

    // Hint that a large object is about to be written at path
    virtual FileOperationHandle prepareDeduplicationHints(const std::string& path) = 0;

    // Repository management
    virtual FileOperationHandle duplicateRepository(const std::string& src, const std::string& dst) = 0;
    virtual FileOperationHandle setRepositoryAttribute(const std::string& repoPath,
                                                       const std::string& attribute,
                                                       bool value) = 0;

    // Identity of the authenticated session
    virtual std::string currentUser() const = 0;
    virtual std::string domain() const = 0;
};

} // namespace Courier::Core::IO
