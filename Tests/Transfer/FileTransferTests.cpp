#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "TransferTestHelpers.h"
#include "Transfer/FileTransfer.h"

using namespace Courier::Core;
using namespace Courier::Core::Transfer;
using courier::test_helpers::MockRepositoryBackend;
using courier::test_helpers::ScopedLogCapture;
using courier::test_helpers::ScopedTempDir;
using courier::test_helpers::makePayload;
using courier::test_helpers::readAllBytes;
using courier::test_helpers::writeAllBytes;

namespace {
    size_t indexOf(const std::vector<std::string>& calls, const std::string& prefix) {
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i].compare(0, prefix.size(), prefix) == 0) return i;
        }
        return calls.size();
    }

    struct Endpoints {
        std::shared_ptr<IO::LocalFileSystemBackend> local = std::make_shared<IO::LocalFileSystemBackend>();
        std::shared_ptr<IO::MemoryFileSystemBackend> memory = std::make_shared<IO::MemoryFileSystemBackend>();
        std::shared_ptr<MockRepositoryBackend> repo = std::make_shared<MockRepositoryBackend>();

        IO::BackendHandle localHandle() const { return IO::BackendHandle(local, "file"); }
        IO::BackendHandle memoryHandle() const { return IO::BackendHandle(memory, "memory"); }
        IO::BackendHandle repoHandle() const { return IO::BackendHandle(repo, "xet"); }
    };
}

TEST(FileTransfer, StreamsLargeFileByteIdenticalAcrossChunks) {
    ScopedTempDir tmp;
    Endpoints ends;
    const auto payload = makePayload(10 * 1024 * 1024);
    writeAllBytes(tmp.path() / "big.bin", payload);

    TransferConfig config;
    config.chunkSize = 1024 * 1024;
    Concurrency::PermitPool permits(2);
    FileTransfer transfer(config, permits);

    auto outcome = transfer.transfer(ends.localHandle(), tmp.join("big.bin"),
                                     ends.localHandle(), tmp.join("copy/big.bin"));
    ASSERT_EQ(outcome, TransferOutcome::Copied);
    EXPECT_EQ(readAllBytes(tmp.path() / "copy" / "big.bin"), payload);
    EXPECT_EQ(transfer.bytesCopied(), payload.size());
    EXPECT_EQ(permits.available(), permits.capacity());
}

TEST(FileTransfer, CopiesEmptyFile) {
    Endpoints ends;
    ends.memory->putFile("/empty", "");
    Concurrency::PermitPool permits(1);
    FileTransfer transfer(TransferConfig{}, permits);

    EXPECT_EQ(transfer.transfer(ends.memoryHandle(), "/empty", ends.memoryHandle(), "/copy", uint64_t{0}),
              TransferOutcome::Copied);
    ASSERT_TRUE(ends.memory->readFile("/copy").has_value());
    EXPECT_TRUE(ends.memory->readFile("/copy")->empty());
}

TEST(FileTransfer, MissingSourceFailsAndReturnsPermit) {
    ScopedLogCapture capture;
    Endpoints ends;
    Concurrency::PermitPool permits(1);
    FileTransfer transfer(TransferConfig{}, permits);

    auto outcome = transfer.transfer(ends.memoryHandle(), "/ghost", ends.memoryHandle(), "/copy");
    EXPECT_EQ(outcome, TransferOutcome::Failed);
    EXPECT_EQ(permits.available(), 1u);
    EXPECT_FALSE(ends.memory->exists("/copy"));
    EXPECT_TRUE(capture.sink().contains("Failed to copy memory:///ghost"));
}

TEST(FileTransfer, AttributesMarkerIsNeverWritten) {
    ScopedLogCapture capture;
    Endpoints ends;
    ends.memory->putFile("/src/.gitattributes", "*.bin filter=lfs");
    Concurrency::PermitPool permits(1);
    FileTransfer transfer(TransferConfig{}, permits);

    auto outcome = transfer.transfer(ends.memoryHandle(), "/src/.gitattributes",
                                     ends.repoHandle(), "alice/repo/main/.gitattributes");
    EXPECT_EQ(outcome, TransferOutcome::Skipped);
    EXPECT_EQ(ends.repo->countCalls("openWrite"), 0u);
    EXPECT_TRUE(capture.sink().contains("Skipping .gitattributes"));
}

TEST(FileTransfer, LargeSizeHintRequestsDeduplicationBeforeWriting) {
    Endpoints ends;
    ends.memory->putFile("/weights.bin", "pretend this is big");
    Concurrency::PermitPool permits(1);
    FileTransfer transfer(TransferConfig{}, permits);

    auto outcome = transfer.transfer(ends.memoryHandle(), "/weights.bin", ends.repoHandle(),
                                     "alice/repo/main/weights.bin", uint64_t{50000000});
    ASSERT_EQ(outcome, TransferOutcome::Copied);

    const auto calls = ends.repo->calls();
    const auto hint = indexOf(calls, "prepareDeduplicationHints:alice/repo/main/weights.bin");
    const auto open = indexOf(calls, "openWrite:alice/repo/main/weights.bin");
    ASSERT_LT(hint, calls.size());
    ASSERT_LT(open, calls.size());
    EXPECT_LT(hint, open);
    EXPECT_EQ(ends.repo->readFile("alice/repo/main/weights.bin").value_or(""), "pretend this is big");
}

TEST(FileTransfer, SizeBelowThresholdSkipsDeduplicationHint) {
    Endpoints ends;
    ends.memory->putFile("/small.bin", "small");
    Concurrency::PermitPool permits(1);
    FileTransfer transfer(TransferConfig{}, permits);

    ASSERT_EQ(transfer.transfer(ends.memoryHandle(), "/small.bin", ends.repoHandle(),
                                "alice/repo/main/small.bin", uint64_t{49999999}),
              TransferOutcome::Copied);
    EXPECT_EQ(ends.repo->countCalls("prepareDeduplicationHints"), 0u);
}

TEST(FileTransfer, MissingSizeHintIsLookedUpFromSource) {
    Endpoints ends;
    ends.memory->putFile("/sized.bin", makePayload(200));
    TransferConfig config;
    config.largeObjectThreshold = 100;
    Concurrency::PermitPool permits(1);
    FileTransfer transfer(config, permits);

    ASSERT_EQ(transfer.transfer(ends.memoryHandle(), "/sized.bin", ends.repoHandle(), "alice/repo/main/sized.bin"),
              TransferOutcome::Copied);
    EXPECT_EQ(ends.repo->countCalls("prepareDeduplicationHints:alice/repo/main/sized.bin"), 1u);
}

TEST(FileTransfer, FailedHintFailsTheItemWithoutWriting) {
    ScopedLogCapture capture;
    Endpoints ends;
    ends.memory->putFile("/weights.bin", "x");
    ends.repo->failNext("prepareDeduplicationHints");
    Concurrency::PermitPool permits(1);
    FileTransfer transfer(TransferConfig{}, permits);

    auto outcome = transfer.transfer(ends.memoryHandle(), "/weights.bin", ends.repoHandle(),
                                     "alice/repo/main/weights.bin", uint64_t{60000000});
    EXPECT_EQ(outcome, TransferOutcome::Failed);
    EXPECT_EQ(ends.repo->countCalls("openWrite"), 0u);
    EXPECT_EQ(permits.available(), 1u);
}

TEST(FileTransfer, RepositoryToRepositoryUsesReferenceCopy) {
    Endpoints ends;
    ends.repo->putFile("alice/repo/main/a.txt", "data");
    Concurrency::PermitPool permits(1);
    FileTransfer transfer(TransferConfig{}, permits);

    ASSERT_EQ(transfer.transfer(ends.repoHandle(), "alice/repo/main/a.txt", ends.repoHandle(), "alice/repo/dev/a.txt"),
              TransferOutcome::Copied);
    EXPECT_EQ(ends.repo->countCalls("copyFile:alice/repo/main/a.txt->alice/repo/dev/a.txt"), 1u);
    EXPECT_EQ(ends.repo->countCalls("openRead"), 0u);
    EXPECT_EQ(transfer.bytesCopied(), 0u);
}

TEST(FileTransfer, UnwritableDestinationFails) {
    ScopedLogCapture capture;
    Endpoints ends;
    ends.memory->putFile("/a", "x");
    ends.repo->failNext("openWrite");
    Concurrency::PermitPool permits(1);
    FileTransfer transfer(TransferConfig{}, permits);

    EXPECT_EQ(transfer.transfer(ends.memoryHandle(), "/a", ends.repoHandle(), "alice/repo/main/a"),
              TransferOutcome::Failed);
    EXPECT_TRUE(capture.sink().contains("cannot open xet://alice/repo/main/a for writing"));
}
