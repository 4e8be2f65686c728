#pragma once
#include <memory>
#include <string>
#include "IFileSystemBackend.h"
#include "ITransactionalBackend.h"

namespace Courier::Core::IO {

/**
 * @brief A backend bound to the protocol tag it was requested under
 *
 * Value-semantic and cheap to copy; the backend itself is shared. When a backend answers to
 * several aliases, protocol() reports the alias the caller asked for, so transfer messages
 * name the endpoint the way the user wrote it.
 */
class BackendHandle {
public:
    BackendHandle() = default;
    BackendHandle(std::shared_ptr<IFileSystemBackend> backend, std::string protocol)
        : _backend(std::move(backend)), _protocol(std::move(protocol)) {}

    const std::string& protocol() const noexcept { return _protocol; }
    bool valid() const noexcept { return _backend != nullptr; }

    IFileSystemBackend& backend() const { return *_backend; }
    IFileSystemBackend* operator->() const { return _backend.get(); }
    const std::shared_ptr<IFileSystemBackend>& shared() const noexcept { return _backend; }

    // Capability query; nullptr for plain backends
    ITransactionalBackend* transactional() const { return _backend ? _backend->asTransactional() : nullptr; }
    bool isContentAddressed() const { return _backend && _backend->getCapabilities().isContentAddressed; }

    // `proto://path` form used in messages
    std::string describe(const std::string& path) const { return _protocol + "://" + path; }

    bool sameBackend(const BackendHandle& other) const noexcept { return _backend == other._backend; }

private:
    std::shared_ptr<IFileSystemBackend> _backend;
    std::string _protocol;
};

} // namespace Courier::Core::IO
