#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>

#include "TransferTestHelpers.h"
#include "Transfer/CopyWalker.h"
#include "Transfer/TransferError.h"

using namespace Courier::Core;
using namespace Courier::Core::Transfer;
using courier::test_helpers::MockRepositoryBackend;
using courier::test_helpers::ScopedLogCapture;
using courier::test_helpers::ScopedTempDir;
using courier::test_helpers::readAllBytes;
using courier::test_helpers::writeAllBytes;

namespace {
    // Walker wired to a running service with a tight contract group
    class WalkerEnv {
    public:
        explicit WalkerEnv(size_t contractCapacity = 4)
            : _service(Concurrency::WorkService::Config{3, 16}),
              _permits(2),
              _transfer(makeConfig(contractCapacity), _permits),
              _walker(_transfer, &_service) {
            _service.start();
        }
        ~WalkerEnv() { _service.stop(); }

        CopyWalker& walker() noexcept { return _walker; }
        Concurrency::PermitPool& permits() noexcept { return _permits; }

    private:
        static TransferConfig makeConfig(size_t contractCapacity) {
            TransferConfig config;
            config.contractCapacity = contractCapacity;
            config.chunkSize = 4096;
            return config;
        }

        Concurrency::WorkService _service;
        Concurrency::PermitPool _permits;
        FileTransfer _transfer;
        CopyWalker _walker;
    };

    IO::BackendHandle localHandle() {
        static auto backend = std::make_shared<IO::LocalFileSystemBackend>();
        return IO::BackendHandle(backend, "file");
    }

    void makeTree(const ScopedTempDir& tmp) {
        writeAllBytes(tmp.path() / "a" / "x.txt", "x contents");
        writeAllBytes(tmp.path() / "a" / "sub" / "y.txt", "y contents");
        std::filesystem::create_directories(tmp.path() / "a" / "hollow");
    }
}

TEST(CopyWalker, RecursiveDirectoryCopyMirrorsTreeIncludingEmptyDirectories) {
    ScopedTempDir tmp;
    makeTree(tmp);
    WalkerEnv env;

    auto summary = env.walker().copy(localHandle(), tmp.join("a"), localHandle(), tmp.join("b"), true);
    EXPECT_TRUE(summary.ok());
    EXPECT_EQ(summary.copied, 2u);
    EXPECT_EQ(readAllBytes(tmp.path() / "b" / "x.txt"), "x contents");
    EXPECT_EQ(readAllBytes(tmp.path() / "b" / "sub" / "y.txt"), "y contents");
    EXPECT_TRUE(std::filesystem::is_directory(tmp.path() / "b" / "hollow"));
    EXPECT_EQ(env.permits().available(), env.permits().capacity());
}

TEST(CopyWalker, NonRecursiveDirectoryCopyWritesNothing) {
    ScopedLogCapture capture;
    ScopedTempDir tmp;
    makeTree(tmp);
    WalkerEnv env;

    auto summary = env.walker().copy(localHandle(), tmp.join("a"), localHandle(), tmp.join("b"), false);
    EXPECT_EQ(summary.copied, 0u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_TRUE(summary.ok());
    EXPECT_FALSE(std::filesystem::exists(tmp.path() / "b"));
    EXPECT_GE(capture.sink().count(Logging::LogLevel::Warning), 1u);
}

TEST(CopyWalker, SingleFileLandsAtDestinationPath) {
    ScopedTempDir tmp;
    makeTree(tmp);
    WalkerEnv env;

    auto summary = env.walker().copy(localHandle(), tmp.join("a/x.txt"), localHandle(), tmp.join("solo.txt"), false);
    EXPECT_EQ(summary.copied, 1u);
    EXPECT_EQ(readAllBytes(tmp.path() / "solo.txt"), "x contents");
}

TEST(CopyWalker, GlobCopiesMatchesRelativeToPatternRoot) {
    auto memory = std::make_shared<IO::MemoryFileSystemBackend>();
    memory->putFile("/in/one.csv", "1");
    memory->putFile("/in/two.csv", "22");
    memory->putFile("/in/skip.txt", "3");
    memory->putFile("/in/nested.csv/inner.csv", "4");
    IO::BackendHandle handle(memory, "memory");
    WalkerEnv env;

    auto summary = env.walker().copy(handle, "/in/*.csv", handle, "/out", false);
    EXPECT_EQ(summary.copied, 2u);
    EXPECT_EQ(memory->readFile("/out/one.csv").value_or(""), "1");
    EXPECT_EQ(memory->readFile("/out/two.csv").value_or(""), "22");
    EXPECT_FALSE(memory->exists("/out/skip.txt"));
    EXPECT_FALSE(memory->exists("/out/nested.csv"));
}

TEST(CopyWalker, RecursiveGlobDescendsIntoMatchedDirectories) {
    auto memory = std::make_shared<IO::MemoryFileSystemBackend>();
    memory->putFile("/in/set1/a", "a");
    memory->putFile("/in/set2/deep/b", "b");
    memory->putFile("/in/other/c", "c");
    IO::BackendHandle handle(memory, "memory");
    WalkerEnv env;

    auto summary = env.walker().copy(handle, "/in/set*", handle, "/out", true);
    EXPECT_TRUE(summary.ok());
    EXPECT_EQ(summary.copied, 2u);
    EXPECT_EQ(memory->readFile("/out/set1/a").value_or(""), "a");
    EXPECT_EQ(memory->readFile("/out/set2/deep/b").value_or(""), "b");
    EXPECT_FALSE(memory->exists("/out/other"));
}

TEST(CopyWalker, WildcardOutsideLastSegmentThrowsBeforeAnyBackendCall) {
    auto repo = std::make_shared<MockRepositoryBackend>();
    IO::BackendHandle handle(repo, "xet");
    WalkerEnv env;

    try {
        env.walker().copy(handle, "alice/repo/main/*/x", handle, "alice/repo/main/out", true);
        FAIL() << "expected InvalidGlob";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::InvalidGlob);
    }
    EXPECT_EQ(repo->callCount(), 0u);
}

TEST(CopyWalker, ManyFilesDrainThroughSmallContractGroup) {
    auto memory = std::make_shared<IO::MemoryFileSystemBackend>();
    for (int i = 0; i < 40; ++i) {
        memory->putFile("/many/f" + std::to_string(i), std::string(static_cast<size_t>(i) + 1, 'z'));
    }
    IO::BackendHandle handle(memory, "memory");
    WalkerEnv env(2);

    auto summary = env.walker().copy(handle, "/many", handle, "/copies", true);
    EXPECT_TRUE(summary.ok());
    EXPECT_EQ(summary.copied, 40u);
    for (int i = 0; i < 40; ++i) {
        EXPECT_EQ(memory->readFile("/copies/f" + std::to_string(i)).value_or("").size(), static_cast<size_t>(i) + 1);
    }
}

TEST(CopyWalker, RepositoryToRepositoryDirectoryUsesDirectoryCopy) {
    auto repo = std::make_shared<MockRepositoryBackend>();
    repo->addBranch("alice/repo/main");
    repo->putFile("alice/repo/main/dir/file", "f");
    IO::BackendHandle handle(repo, "xet");
    WalkerEnv env;

    auto summary = env.walker().copy(handle, "alice/repo/main/dir", handle, "alice/repo/main/dir2", true);
    EXPECT_EQ(summary.copied, 1u);
    EXPECT_EQ(repo->countCalls("copyDirectory:alice/repo/main/dir->alice/repo/main/dir2"), 1u);
    EXPECT_EQ(repo->countCalls("listDirectory"), 0u);
}

TEST(CopyWalker, PartialFailuresAreCountedNotThrown) {
    ScopedLogCapture capture;
    auto memory = std::make_shared<IO::MemoryFileSystemBackend>();
    memory->putFile("/src/ok", "fine");
    memory->putFile("/src/blocked", "nope");
    memory->createDirectory("/dst/blocked").wait();  // a directory where the file should land
    IO::BackendHandle handle(memory, "memory");
    WalkerEnv env;

    auto summary = env.walker().copy(handle, "/src", handle, "/dst", true);
    EXPECT_FALSE(summary.ok());
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.copied, 1u);
    EXPECT_EQ(memory->readFile("/dst/ok").value_or(""), "fine");
}

TEST(CopyWalker, NonStandardExceptionFromBackendCountsAsFailure) {
    ScopedLogCapture capture;
    auto memory = std::make_shared<IO::MemoryFileSystemBackend>();
    memory->putFile("/src/one", "1");
    memory->putFile("/src/two", "2");
    auto repo = std::make_shared<MockRepositoryBackend>();
    repo->addBranch("alice/repo/main");
    repo->failNext("openWriteThrows");
    WalkerEnv env;

    auto summary = env.walker().copy(IO::BackendHandle(memory, "memory"), "/src",
                                     IO::BackendHandle(repo, "xet"), "alice/repo/main/dst", true);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.copied, 1u);
    EXPECT_TRUE(capture.sink().contains("unknown exception"));
    EXPECT_EQ(env.permits().available(), env.permits().capacity());
}

TEST(CopyWalker, DestinationDirectoriesExistBeforeFilesAreWritten) {
    auto memory = std::make_shared<IO::MemoryFileSystemBackend>();
    memory->putFile("/tree/a.txt", "a");
    memory->putFile("/tree/d1/b.txt", "b");
    memory->putFile("/tree/d1/d2/c.txt", "c");
    auto repo = std::make_shared<MockRepositoryBackend>();
    repo->addBranch("alice/repo/main");
    WalkerEnv env;

    auto summary = env.walker().copy(IO::BackendHandle(memory, "memory"), "/tree",
                                     IO::BackendHandle(repo, "xet"), "alice/repo/main/out", true);
    ASSERT_TRUE(summary.ok());
    ASSERT_EQ(summary.copied, 3u);

    const auto calls = repo->calls();
    auto indexOf = [&calls](const std::string& call) {
        return static_cast<size_t>(std::find(calls.begin(), calls.end(), call) - calls.begin());
    };
    const std::string writePrefix = "openWrite:";
    size_t writes = 0;
    for (size_t i = 0; i < calls.size(); ++i) {
        if (calls[i].compare(0, writePrefix.size(), writePrefix) != 0) continue;
        ++writes;
        const std::string target = calls[i].substr(writePrefix.size());
        const std::string parent = target.substr(0, target.rfind('/'));
        const size_t created = indexOf("createDirectory:" + parent);
        ASSERT_LT(created, calls.size()) << "no createDirectory for " << parent;
        EXPECT_LT(created, i) << target << " written before its directory was created";
    }
    EXPECT_EQ(writes, 3u);
    EXPECT_EQ(repo->readFile("alice/repo/main/out/d1/d2/c.txt").value_or(""), "c");
}
