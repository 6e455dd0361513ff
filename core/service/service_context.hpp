#ifndef TANGOREST_SERVICE_SERVICE_CONTEXT_HPP
#define TANGOREST_SERVICE_SERVICE_CONTEXT_HPP

#include <chrono>
#include <memory>

#include "bridge/attribute_bridge.hpp"
#include "directory/cached_directory.hpp"
#include "pool/connection_pool.hpp"
#include "remote/i_device_handle.hpp"
#include "remote/i_directory_service.hpp"

namespace tangorest {
namespace service {

struct ContextOptions {
    std::chrono::steady_clock::duration directory_ttl = std::chrono::seconds(10);
    size_t max_handles = pool::kDefaultMaxHandles;
    // Clock for directory cache expiry; tests substitute a manual one
    directory::CachedDirectory::ResultCache::NowFn now = [] { return std::chrono::steady_clock::now(); };
};

/**
 * @brief Shared state of the service: handle pool + cached directory
 *
 * Constructed once at startup and passed to every operation. Owns the only
 * caches in the process; destroying the context drops them all.
 */
class ServiceContext {
public:
    ServiceContext(std::shared_ptr<remote::IDirectoryService> directory,
                   std::shared_ptr<remote::IDeviceConnector> connector, const ContextOptions &options = {});

    ServiceContext(const ServiceContext &) = delete;
    ServiceContext &operator=(const ServiceContext &) = delete;

    directory::CachedDirectory &directory() { return directory_; }
    pool::ConnectionPool &pool() { return pool_; }
    const bridge::AttributeBridge &bridge() const { return bridge_; }

private:
    directory::CachedDirectory directory_;
    pool::ConnectionPool pool_;
    bridge::AttributeBridge bridge_;
};

}  // namespace service
}  // namespace tangorest

#endif  // TANGOREST_SERVICE_SERVICE_CONTEXT_HPP
