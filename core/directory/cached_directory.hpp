#ifndef TANGOREST_DIRECTORY_CACHED_DIRECTORY_HPP
#define TANGOREST_DIRECTORY_CACHED_DIRECTORY_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "cache/ttl_cache.hpp"
#include "remote/i_directory_service.hpp"

namespace tangorest {
namespace directory {

// Device entry as registered in the directory
struct DeviceDirectoryInfo {
    std::string name;
    std::string ior;
    std::string version;
    std::string server;
    std::string host;
    std::string started_date;
    std::string stopped_date;
    std::string class_name;
    bool exported = false;
    int64_t pid = 0;
};

// Read freshness for a single query
enum class ReadMode {
    CACHED,  // May be served from the TTL cache
    FRESH    // Always reaches the directory (result still refreshes the cache)
};

/**
 * @brief Directory facade that caches read-class queries
 *
 * Operations flagged cacheable in directory_op_traits() go through a TTL
 * cache keyed by their argument list; each operation gets its own cache,
 * created on first use. All other operations are forwarded every time.
 *
 * The facade is itself an IDirectoryService, so it can be stacked wherever
 * the raw directory is accepted.
 */
class CachedDirectory : public remote::IDirectoryService {
public:
    using ResultCache = cache::TtlCache<remote::StringList, remote::DirectoryReply>;

    CachedDirectory(std::shared_ptr<remote::IDirectoryService> backend, std::chrono::steady_clock::duration ttl,
                    ResultCache::NowFn now = [] { return std::chrono::steady_clock::now(); });

    CachedDirectory(const CachedDirectory &) = delete;
    CachedDirectory &operator=(const CachedDirectory &) = delete;

    bool execute(remote::DirectoryOp op, const remote::StringList &args, remote::DirectoryReply &reply,
                 errors::ErrorStack &errors) override;

    bool execute(remote::DirectoryOp op, const remote::StringList &args, remote::DirectoryReply &reply,
                 errors::ErrorStack &errors, ReadMode mode);

    // Typed queries
    bool get_device_wide_list(const std::string &wildcard, remote::StringList &devices, errors::ErrorStack &errors);
    bool get_device_info(const std::string &device, DeviceDirectoryInfo &info, errors::ErrorStack &errors);
    bool get_device_property_list(const std::string &device, const std::string &wildcard,
                                  remote::StringList &properties, errors::ErrorStack &errors);
    bool get_device_property(const std::string &device, const remote::StringList &names, remote::StringList &flat,
                             errors::ErrorStack &errors, ReadMode mode = ReadMode::CACHED);

    // Mutations (never cached)
    bool put_device_property(const remote::StringList &flat, errors::ErrorStack &errors);
    bool delete_device_property(const std::string &device, const remote::StringList &names,
                                errors::ErrorStack &errors);

    // Cache for an operation, or nullptr if none created yet / not cacheable
    const ResultCache *cache_for(remote::DirectoryOp op) const;

    std::chrono::steady_clock::duration ttl() const { return ttl_; }

private:
    ResultCache &cache_for_op(remote::DirectoryOp op);

    std::shared_ptr<remote::IDirectoryService> backend_;
    std::chrono::steady_clock::duration ttl_;
    ResultCache::NowFn now_;

    mutable std::mutex caches_mutex_;
    std::map<remote::DirectoryOp, std::unique_ptr<ResultCache>> caches_;
};

}  // namespace directory
}  // namespace tangorest

#endif  // TANGOREST_DIRECTORY_CACHED_DIRECTORY_HPP
