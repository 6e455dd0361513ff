#include "connection_pool.hpp"

#include "logging/logger.hpp"

namespace tangorest {
namespace pool {

ConnectionPool::ConnectionPool(std::shared_ptr<remote::IDeviceConnector> connector, size_t max_handles)
    : connector_(std::move(connector)), max_handles_(max_handles == 0 ? 1 : max_handles) {}

bool ConnectionPool::acquire(const remote::EntityId &id, std::shared_ptr<remote::IDeviceHandle> &handle,
                             errors::ErrorStack &errors) {
    const std::string &key = id.str();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(key);
        if (it != handles_.end()) {
            handle = it->second;
            return true;
        }
    }

    // Connect outside the lock (remote round trip)
    std::shared_ptr<remote::IDeviceHandle> created;
    if (!connector_->connect(id, created, errors) || !created) {
        errors::ensure_cause(errors, errors::ErrorKind::CONNECTION, "Cannot connect to device " + key,
                             "ConnectionPool::acquire");
        LOG_WARN("[ConnectionPool] Connection to " << key << " failed: " << errors.front().description);
        return false;
    }

    std::string evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(key);
        if (it != handles_.end()) {
            // Lost a creation race: last write wins, insertion position kept
            it->second = created;
        } else {
            handles_.emplace(key, created);
            insertion_order_.push_back(key);
            if (handles_.size() > max_handles_) {
                evicted = insertion_order_.front();
                insertion_order_.pop_front();
                handles_.erase(evicted);
            }
        }
    }

    if (!evicted.empty()) {
        LOG_INFO("[ConnectionPool] Evicted " << evicted << " (capacity " << max_handles_ << ")");
    }
    LOG_DEBUG("[ConnectionPool] Connected " << key);

    handle = std::move(created);
    return true;
}

bool ConnectionPool::contains(const remote::EntityId &id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.find(id.str()) != handles_.end();
}

size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

std::vector<std::string> ConnectionPool::identifiers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(insertion_order_.begin(), insertion_order_.end());
}

}  // namespace pool
}  // namespace tangorest
