#include "service_context.hpp"

#include "logging/logger.hpp"

namespace tangorest {
namespace service {

ServiceContext::ServiceContext(std::shared_ptr<remote::IDirectoryService> directory,
                               std::shared_ptr<remote::IDeviceConnector> connector, const ContextOptions &options)
    : directory_(std::move(directory), options.directory_ttl, options.now),
      pool_(std::move(connector), options.max_handles) {
    LOG_INFO("[ServiceContext] Directory TTL "
             << std::chrono::duration_cast<std::chrono::milliseconds>(options.directory_ttl).count()
             << "ms, pool capacity " << pool_.max_size());
}

}  // namespace service
}  // namespace tangorest
