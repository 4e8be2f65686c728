#include <gtest/gtest.h>

#include "TransferTestHelpers.h"
#include "Transfer/TransactionScope.h"
#include "Transfer/TransferError.h"

using namespace Courier::Core;
using namespace Courier::Core::Transfer;
using courier::test_helpers::MockRepositoryBackend;
using courier::test_helpers::ScopedLogCapture;

TEST(TransactionScope, CommitEndsTransactionWithMessage) {
    MockRepositoryBackend repo;
    {
        TransactionScope scope(&repo, "copy a to b");
        EXPECT_TRUE(scope.active());
        EXPECT_TRUE(repo.inTransaction());
        scope.commit();
        EXPECT_FALSE(scope.active());
    }
    EXPECT_EQ(repo.transactionsCommitted(), 1u);
    EXPECT_EQ(repo.transactionsAborted(), 0u);
    EXPECT_EQ(repo.lastCommitMessage(), "copy a to b");
}

TEST(TransactionScope, LeavingWithoutCommitAborts) {
    ScopedLogCapture capture;
    MockRepositoryBackend repo;
    {
        TransactionScope scope(&repo, "delete [x]");
    }
    EXPECT_EQ(repo.transactionsAborted(), 1u);
    EXPECT_FALSE(repo.inTransaction());
    EXPECT_TRUE(capture.sink().contains("Transaction aborted: delete [x]"));
}

TEST(TransactionScope, ExceptionUnwindAborts) {
    ScopedLogCapture capture;
    MockRepositoryBackend repo;
    try {
        TransactionScope scope(&repo, "move");
        throw TransferError(TransferErrc::BackendFailure, "boom");
    } catch (const TransferError&) {
    }
    EXPECT_EQ(repo.transactionsAborted(), 1u);
    EXPECT_EQ(repo.transactionsCommitted(), 0u);
}

TEST(TransactionScope, NestedTransactionIsRejected) {
    ScopedLogCapture capture;
    MockRepositoryBackend repo;
    TransactionScope outer(&repo, "outer");
    try {
        TransactionScope inner(&repo, "inner");
        FAIL() << "expected BackendFailure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::BackendFailure);
    }
    EXPECT_TRUE(repo.inTransaction());
    EXPECT_EQ(repo.transactionsBegun(), 1u);
}

TEST(TransactionScope, NullBackendIsInert) {
    TransactionScope scope(nullptr, "local copy");
    EXPECT_FALSE(scope.active());
    EXPECT_NO_THROW(scope.commit());
}
