/**
 * @file BackendRegistry.h
 * @brief Maps protocol tags to backend factories
 *
 * The registry is constructed explicitly and handed to the components that resolve URIs.
 * Plain backends are registered per tag; one content-addressed session factory can be
 * installed for the `xet` tag. Lookups are shared-locked, registration is exclusive.
 */
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "IFileSystemBackend.h"

namespace Courier::Core::IO {

class BackendRegistry {
public:
    using Factory = std::function<std::shared_ptr<IFileSystemBackend>()>;

    static constexpr const char* ContentAddressedTag = "xet";

    BackendRegistry() = default;
    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    /**
     * @brief Registry with the built-in `file` and `memory` backends
     *
     * The memory backend is one shared instance reachable under each of its aliases, so data
     * written through one handle is visible through the next.
     */
    static std::shared_ptr<BackendRegistry> createDefault();

    // Registers a factory for a single tag; replaces any previous registration
    void registerBackend(const std::string& tag, Factory factory);

    // Registers one shared instance under every tag it reports through protocols()
    void registerInstance(std::shared_ptr<IFileSystemBackend> backend);

    // Installs the session factory for the content-addressed tag
    void setContentAddressedFactory(Factory factory);

    bool hasBackend(const std::string& tag) const;
    std::vector<std::string> tags() const;

    /**
     * @brief Creates (or returns the shared) backend for a tag
     * @return nullptr when no factory is registered for the tag or the factory yields nothing
     */
    std::shared_ptr<IFileSystemBackend> create(const std::string& tag) const;

private:
    mutable std::shared_mutex _mutex;
    std::map<std::string, Factory> _factories;
};

} // namespace Courier::Core::IO
