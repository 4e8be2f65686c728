#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "Courier.h"

namespace courier::test_helpers
{

// RAII temporary directory that gets cleaned up on destruction
class ScopedTempDir
{
public:
    ScopedTempDir() {
        namespace fs = std::filesystem;
        auto base = fs::temp_directory_path();
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        auto rnd = gen();
        std::ostringstream oss;
        oss << "Courier_Test_" << std::hex << now << "_" << rnd;
        _path = base / oss.str();
        std::error_code ec;
        fs::create_directories(_path, ec);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);  // best-effort cleanup
    }

    const std::filesystem::path& path() const noexcept {
        return _path;
    }
    std::string join(const std::string& name) const {
        return (_path / name).generic_string();
    }

private:
    std::filesystem::path _path;
};

std::string readAllBytes(const std::filesystem::path& p);
void writeAllBytes(const std::filesystem::path& p, const std::string& contents);

// Deterministic pseudo-random payload of the given size
std::string makePayload(size_t size, uint32_t seed = 7);

// Log sink that keeps every record for later assertions
class CapturingLogSink : public Courier::Core::Logging::ILogSink
{
public:
    void write(const Courier::Core::Logging::LogEntry& entry) override;
    void flush() override {}

    std::vector<Courier::Core::Logging::LogEntry> entries() const;
    size_t count(Courier::Core::Logging::LogLevel level) const;
    bool contains(const std::string& needle) const;

private:
    mutable std::mutex _mutex;
    std::vector<Courier::Core::Logging::LogEntry> _entries;
};

// Installs a CapturingLogSink on the global logger for one test and restores the console after
class ScopedLogCapture
{
public:
    ScopedLogCapture();
    ~ScopedLogCapture();

    CapturingLogSink& sink() noexcept { return *_sink; }

private:
    std::shared_ptr<CapturingLogSink> _sink;
    Courier::Core::Logging::LogLevel _previousLevel;
};

/**
 * In-memory repository backend standing in for a xet session.
 *
 * Paths are `user/repo/branch/...`; data lives in an inner MemoryFileSystemBackend. Every
 * operational call is appended to calls() so tests can assert order and count.
 */
class MockRepositoryBackend : public Courier::Core::IO::ITransactionalBackend
{
public:
    MockRepositoryBackend();

    // Configuration
    void addBranch(const std::string& userRepoBranch);
    // Arms one failure of the named call; "openWriteThrows" throws a non-std value instead
    void failNext(const std::string& operation);
    void putFile(const std::string& path, const std::string& contents) { _store->putFile(path, contents); }
    std::optional<std::string> readFile(const std::string& path) const { return _store->readFile(path); }

    // Inspection
    std::vector<std::string> calls() const;
    size_t callCount() const;
    size_t countCalls(const std::string& prefix) const;
    size_t transactionsBegun() const { return _begun.load(); }
    size_t transactionsCommitted() const { return _committed.load(); }
    size_t transactionsAborted() const { return _aborted.load(); }

    // IFileSystemBackend
    Courier::Core::IO::BackendCapabilities getCapabilities() const override;
    std::string getBackendType() const override { return "MockRepository"; }
    std::vector<std::string> protocols() const override { return {"xet"}; }
    Courier::Core::IO::FileOperationHandle getMetadata(const std::string& path) override;
    bool exists(const std::string& path) override;
    std::unique_ptr<Courier::Core::IO::FileStream> openStream(const std::string& path,
                                                             Courier::Core::IO::StreamOptions options = {}) override;
    Courier::Core::IO::FileOperationHandle listDirectory(const std::string& path,
                                                        Courier::Core::IO::ListDirectoryOptions options = {}) override;
    Courier::Core::IO::FileOperationHandle glob(const std::string& pattern) override;
    Courier::Core::IO::FileOperationHandle createDirectory(const std::string& path) override;
    Courier::Core::IO::FileOperationHandle moveFile(const std::string& src, const std::string& dst) override;
    Courier::Core::IO::FileOperationHandle remove(const std::string& path, bool recursive = false) override;

    // ITransactionalBackend
    Courier::Core::IO::FileOperationHandle beginTransaction(const std::string& commitMessage) override;
    Courier::Core::IO::FileOperationHandle endTransaction() override;
    Courier::Core::IO::FileOperationHandle abortTransaction() override;
    bool inTransaction() const override { return _inTransaction.load(); }
    Courier::Core::IO::FileOperationHandle branchInfo(const std::string& path,
                                                     Courier::Core::IO::BranchInfo* out = nullptr) override;
    bool isDirectoryOrBranch(const std::string& path) override;
    Courier::Core::IO::FileOperationHandle copyFile(const std::string& src, const std::string& dst) override;
    Courier::Core::IO::FileOperationHandle copyDirectory(const std::string& src, const std::string& dst) override;
    Courier::Core::IO::FileOperationHandle prepareDeduplicationHints(const std::string& path) override;
    Courier::Core::IO::FileOperationHandle duplicateRepository(const std::string& src, const std::string& dst) override;
    Courier::Core::IO::FileOperationHandle setRepositoryAttribute(const std::string& repoPath,
                                                                 const std::string& attribute,
                                                                 bool value) override;
    std::string currentUser() const override { return "alice"; }
    std::string domain() const override { return "https://xethub.example"; }

    std::string lastCommitMessage() const;

private:
    void record(const std::string& call) const;
    bool consumeFailure(const std::string& operation);

    std::shared_ptr<Courier::Core::IO::MemoryFileSystemBackend> _store;
    mutable std::mutex _mutex;
    mutable std::vector<std::string> _calls;
    std::set<std::string> _branches;
    std::multiset<std::string> _failures;
    std::string _pendingMessage;
    std::string _lastCommitMessage;
    std::atomic<bool> _inTransaction{false};
    std::atomic<size_t> _begun{0};
    std::atomic<size_t> _committed{0};
    std::atomic<size_t> _aborted{0};
};

// Running service, permit pool and a registry with local, memory and a mock repository under xet://
class ScopedWorkEnv
{
public:
    explicit ScopedWorkEnv(Courier::Core::Transfer::TransferConfig config = {})
        : _service(Courier::Core::Concurrency::WorkService::Config{4, 64}),
          _permits(config.maxConcurrentCopies),
          _registry(Courier::Core::IO::BackendRegistry::createDefault()),
          _repository(std::make_shared<MockRepositoryBackend>()) {
        _service.start();
        _registry->registerInstance(_repository);
        _memory = std::dynamic_pointer_cast<Courier::Core::IO::MemoryFileSystemBackend>(_registry->create("memory"));
        _coordinator = std::make_unique<Courier::Core::Transfer::TransferCoordinator>(_registry, _permits, config,
                                                                                       &_service);
    }

    ~ScopedWorkEnv() {
        _coordinator.reset();
        _service.stop();
    }

    Courier::Core::Transfer::TransferCoordinator& coordinator() noexcept { return *_coordinator; }
    Courier::Core::Concurrency::WorkService& service() noexcept { return _service; }
    Courier::Core::Concurrency::PermitPool& permits() noexcept { return _permits; }
    const std::shared_ptr<Courier::Core::IO::BackendRegistry>& registry() const noexcept { return _registry; }
    Courier::Core::IO::MemoryFileSystemBackend& memory() noexcept { return *_memory; }
    MockRepositoryBackend& repository() noexcept { return *_repository; }

private:
    Courier::Core::Concurrency::WorkService _service;
    Courier::Core::Concurrency::PermitPool _permits;
    std::shared_ptr<Courier::Core::IO::BackendRegistry> _registry;
    std::shared_ptr<MockRepositoryBackend> _repository;
    std::shared_ptr<Courier::Core::IO::MemoryFileSystemBackend> _memory;
    std::unique_ptr<Courier::Core::Transfer::TransferCoordinator> _coordinator;
};

}  // namespace courier::test_helpers
