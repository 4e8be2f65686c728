#include "BackendRegistry.h"
#include "LocalFileSystemBackend.h"
#include "MemoryFileSystemBackend.h"
#include <mutex>

namespace Courier::Core::IO {

std::shared_ptr<BackendRegistry> BackendRegistry::createDefault() {
    auto registry = std::make_shared<BackendRegistry>();
    registry->registerInstance(std::make_shared<LocalFileSystemBackend>());
    registry->registerInstance(std::make_shared<MemoryFileSystemBackend>());
    return registry;
}

void BackendRegistry::registerBackend(const std::string& tag, Factory factory) {
    std::unique_lock lock(_mutex);
    if (factory) {
        _factories[tag] = std::move(factory);
    } else {
        _factories.erase(tag);
    }
}

void BackendRegistry::registerInstance(std::shared_ptr<IFileSystemBackend> backend) {
    if (!backend) return;
    auto tags = backend->protocols();
    std::unique_lock lock(_mutex);
    for (const auto& tag : tags) {
        _factories[tag] = [backend]() { return backend; };
    }
}

void BackendRegistry::setContentAddressedFactory(Factory factory) {
    registerBackend(ContentAddressedTag, std::move(factory));
}

bool BackendRegistry::hasBackend(const std::string& tag) const {
    std::shared_lock lock(_mutex);
    return _factories.count(tag) > 0;
}

std::vector<std::string> BackendRegistry::tags() const {
    std::shared_lock lock(_mutex);
    std::vector<std::string> out;
    out.reserve(_factories.size());
    for (const auto& [tag, factory] : _factories) {
        out.push_back(tag);
    }
    return out;
}

std::shared_ptr<IFileSystemBackend> BackendRegistry::create(const std::string& tag) const {
    Factory factory;
    {
        std::shared_lock lock(_mutex);
        auto it = _factories.find(tag);
        if (it == _factories.end()) return nullptr;
        factory = it->second;
    }
    // Factories may be slow (session setup); run them outside the lock
    return factory();
}

} // namespace Courier::Core::IO
