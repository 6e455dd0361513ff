#include "cached_directory.hpp"

#include "logging/logger.hpp"

namespace tangorest {
namespace directory {

using remote::DirectoryOp;
using remote::DirectoryReply;
using remote::StringList;

CachedDirectory::CachedDirectory(std::shared_ptr<remote::IDirectoryService> backend,
                                 std::chrono::steady_clock::duration ttl, ResultCache::NowFn now)
    : backend_(std::move(backend)), ttl_(ttl), now_(std::move(now)) {}

bool CachedDirectory::execute(DirectoryOp op, const StringList &args, DirectoryReply &reply,
                              errors::ErrorStack &errors) {
    return execute(op, args, reply, errors, ReadMode::CACHED);
}

bool CachedDirectory::execute(DirectoryOp op, const StringList &args, DirectoryReply &reply,
                              errors::ErrorStack &errors, ReadMode mode) {
    const auto &traits = remote::directory_op_traits(op);

    auto forward = [this, op, &args, &traits](DirectoryReply &out, errors::ErrorStack &errs) {
        if (!backend_->execute(op, args, out, errs)) {
            errors::ensure_cause(errs, errors::ErrorKind::REMOTE_CALL,
                                 std::string(traits.wire_name) + " failed", "CachedDirectory::execute");
            LOG_WARN("[CachedDirectory] " << traits.wire_name << " failed: " << errs.front().description);
            return false;
        }
        return true;
    };

    if (!traits.cacheable) {
        return forward(reply, errors);
    }

    auto &cache = cache_for_op(op);
    if (mode == ReadMode::CACHED) {
        const size_t misses_before = cache.misses();
        if (!cache.get_or_compute(args, forward, reply, errors)) {
            return false;
        }
        if (cache.misses() == misses_before) {
            LOG_DEBUG("[CachedDirectory] Cache hit: " << traits.wire_name);
        }
        return true;
    }

    // FRESH: go to the directory, then let the result refresh the cache
    if (!forward(reply, errors)) {
        return false;
    }
    cache.put(args, reply);
    return true;
}

CachedDirectory::ResultCache &CachedDirectory::cache_for_op(DirectoryOp op) {
    std::lock_guard<std::mutex> lock(caches_mutex_);
    auto it = caches_.find(op);
    if (it == caches_.end()) {
        LOG_DEBUG("[CachedDirectory] Creating cache for " << remote::directory_op_traits(op).wire_name);
        it = caches_.emplace(op, std::make_unique<ResultCache>(ttl_, now_)).first;
    }
    return *it->second;
}

const CachedDirectory::ResultCache *CachedDirectory::cache_for(DirectoryOp op) const {
    std::lock_guard<std::mutex> lock(caches_mutex_);
    auto it = caches_.find(op);
    return it == caches_.end() ? nullptr : it->second.get();
}

bool CachedDirectory::get_device_wide_list(const std::string &wildcard, StringList &devices,
                                           errors::ErrorStack &errors) {
    DirectoryReply reply;
    if (!execute(DirectoryOp::GET_DEVICE_WIDE_LIST, {wildcard}, reply, errors)) {
        return false;
    }
    devices = reply.strings;
    return true;
}

bool CachedDirectory::get_device_info(const std::string &device, DeviceDirectoryInfo &info,
                                      errors::ErrorStack &errors) {
    DirectoryReply reply;
    if (!execute(DirectoryOp::GET_DEVICE_INFO, {device}, reply, errors)) {
        return false;
    }

    // strings: name, ior, version, server, host, started, stopped[, class]
    // longs: exported, pid
    if (reply.strings.size() < 7 || reply.longs.size() < 2) {
        errors.push_back(errors::make_error(errors::ErrorKind::MALFORMED_WIRE_DATA,
                                            "Device info reply for " + device + " has " +
                                                std::to_string(reply.strings.size()) + " strings and " +
                                                std::to_string(reply.longs.size()) + " longs",
                                            "CachedDirectory::get_device_info"));
        return false;
    }

    info.name = reply.strings[0];
    info.ior = reply.strings[1];
    info.version = reply.strings[2];
    info.server = reply.strings[3];
    info.host = reply.strings[4];
    info.started_date = reply.strings[5];
    info.stopped_date = reply.strings[6];
    info.class_name = reply.strings.size() > 7 ? reply.strings[7] : std::string();
    info.exported = reply.longs[0] != 0;
    info.pid = reply.longs[1];
    return true;
}

bool CachedDirectory::get_device_property_list(const std::string &device, const std::string &wildcard,
                                               StringList &properties, errors::ErrorStack &errors) {
    DirectoryReply reply;
    if (!execute(DirectoryOp::GET_DEVICE_PROPERTY_LIST, {device, wildcard}, reply, errors)) {
        return false;
    }
    properties = reply.strings;
    return true;
}

bool CachedDirectory::get_device_property(const std::string &device, const StringList &names, StringList &flat,
                                          errors::ErrorStack &errors, ReadMode mode) {
    StringList args;
    args.reserve(names.size() + 1);
    args.push_back(device);
    args.insert(args.end(), names.begin(), names.end());

    DirectoryReply reply;
    if (!execute(DirectoryOp::GET_DEVICE_PROPERTY, args, reply, errors, mode)) {
        return false;
    }
    flat = reply.strings;
    return true;
}

bool CachedDirectory::put_device_property(const StringList &flat, errors::ErrorStack &errors) {
    DirectoryReply reply;
    return execute(DirectoryOp::PUT_DEVICE_PROPERTY, flat, reply, errors);
}

bool CachedDirectory::delete_device_property(const std::string &device, const StringList &names,
                                             errors::ErrorStack &errors) {
    StringList args;
    args.reserve(names.size() + 1);
    args.push_back(device);
    args.insert(args.end(), names.begin(), names.end());

    DirectoryReply reply;
    return execute(DirectoryOp::DELETE_DEVICE_PROPERTY, args, reply, errors);
}

}  // namespace directory
}  // namespace tangorest
