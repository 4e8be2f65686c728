#include <gtest/gtest.h>

#include "TransferTestHelpers.h"
#include "Transfer/CopyValidation.h"
#include "Transfer/TransferError.h"

using namespace Courier::Core;
using namespace Courier::Core::Transfer;
using courier::test_helpers::MockRepositoryBackend;

namespace {
    struct Handles {
        std::shared_ptr<MockRepositoryBackend> repo = std::make_shared<MockRepositoryBackend>();
        std::shared_ptr<IO::MemoryFileSystemBackend> memory = std::make_shared<IO::MemoryFileSystemBackend>();
        IO::BackendHandle xet() const { return IO::BackendHandle(repo, "xet"); }
        IO::BackendHandle mem() const { return IO::BackendHandle(memory, "memory"); }
    };
}

TEST(CopyValidation, PlainBackendsNeedNoBranch) {
    Handles h;
    EXPECT_NO_THROW(validateCopy(h.mem(), "/a", h.mem(), "/b"));
}

TEST(CopyValidation, UploadIntoUnknownBranch_Throws) {
    Handles h;
    try {
        validateCopy(h.mem(), "/a", h.xet(), "alice/repo/nobranch/a");
        FAIL() << "expected BranchNotFound";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::BranchNotFound);
    }
}

TEST(CopyValidation, DownloadChecksSourceBranch) {
    Handles h;
    h.repo->addBranch("alice/repo/main");
    EXPECT_NO_THROW(validateCopy(h.xet(), "alice/repo/main/a", h.mem(), "/a"));
    EXPECT_EQ(h.repo->countCalls("branchInfo:alice/repo/main/a"), 1u);
    EXPECT_THROW(validateCopy(h.xet(), "alice/repo/gone/a", h.mem(), "/a"), TransferError);
}

TEST(CopyValidation, BranchToBranchSkipsDestinationCheck) {
    Handles h;
    h.repo->addBranch("alice/repo/main");
    EXPECT_NO_THROW(validateCopy(h.xet(), "alice/repo/main", h.xet(), "alice/repo/newbranch"));
    EXPECT_EQ(h.repo->countCalls("branchInfo:alice/repo/newbranch"), 0u);
}

TEST(CopyValidation, RepositoryFileCopyChecksBothBranches) {
    Handles h;
    h.repo->addBranch("alice/repo/main");
    EXPECT_THROW(validateCopy(h.xet(), "alice/repo/main/a", h.xet(), "alice/repo/dev/a"), TransferError);
    h.repo->addBranch("alice/repo/dev");
    EXPECT_NO_THROW(validateCopy(h.xet(), "alice/repo/main/a", h.xet(), "alice/repo/dev/a"));
}
