#ifndef TANGOREST_POOL_CONNECTION_POOL_HPP
#define TANGOREST_POOL_CONNECTION_POOL_HPP

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "remote/entity_id.hpp"
#include "remote/i_device_handle.hpp"

namespace tangorest {
namespace pool {

constexpr size_t kDefaultMaxHandles = 100;

/**
 * @brief Bounded pool of live device handles
 *
 * Handles are created lazily on first acquire() and shared by every caller
 * addressing the same identifier. When an insertion takes the pool past its
 * capacity, exactly one handle is evicted: the oldest by INSERTION order.
 * Re-acquiring a pooled identifier does not refresh its position, so this is
 * FIFO, not LRU.
 *
 * Thread Safety:
 * - Bookkeeping (map + insertion order) is guarded by one mutex
 * - Handle creation is a remote round trip and runs without the lock; two
 *   callers racing on the same new identifier may both create a handle, and
 *   the later commit replaces the earlier one in place (position unchanged)
 *
 * Evicted handles stay alive for callers still holding the shared_ptr.
 * There is no explicit close path.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(std::shared_ptr<remote::IDeviceConnector> connector,
                            size_t max_handles = kDefaultMaxHandles);

    ConnectionPool(const ConnectionPool &) = delete;
    ConnectionPool &operator=(const ConnectionPool &) = delete;

    /**
     * @brief Get the pooled handle for `id`, connecting on first use
     *
     * @param id Target device
     * @param handle Output handle (unchanged on failure)
     * @param errors Connection failure causes (a ConnectionError record is
     *               added if the remote supplied none)
     * @return true on success
     */
    bool acquire(const remote::EntityId &id, std::shared_ptr<remote::IDeviceHandle> &handle,
                 errors::ErrorStack &errors);

    bool contains(const remote::EntityId &id) const;
    size_t size() const;
    size_t max_size() const { return max_handles_; }

    // Pooled identifiers, oldest insertion first
    std::vector<std::string> identifiers() const;

private:
    std::shared_ptr<remote::IDeviceConnector> connector_;
    const size_t max_handles_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<remote::IDeviceHandle>> handles_;
    std::deque<std::string> insertion_order_;
};

}  // namespace pool
}  // namespace tangorest

#endif  // TANGOREST_POOL_CONNECTION_POOL_HPP
