#ifndef TANGOREST_CACHE_TTL_CACHE_HPP
#define TANGOREST_CACHE_TTL_CACHE_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

#include "errors/error_record.hpp"

namespace tangorest {
namespace cache {

/**
 * @brief Key -> value cache with a fixed per-instance time-to-live
 *
 * Entries are served only while `now - inserted < ttl`. Expiry is checked
 * lazily on lookup; an expired entry behaves as a miss and is overwritten by
 * the next successful computation. Nothing sweeps the map in the background.
 *
 * Thread Safety:
 * - Bookkeeping is guarded by a mutex
 * - The compute callback runs WITHOUT the lock held (it is a blocking remote
 *   call), so two concurrent misses on the same key may both compute; the
 *   later store wins
 *
 * Failed computations are never stored.
 *
 * @tparam Key   Call signature; must be less-than comparable as a unit
 * @tparam Value Cached result
 */
template <typename Key, typename Value>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    // Produces the value; returns false and fills `errors` on failure
    using ComputeFn = std::function<bool(Value &, errors::ErrorStack &)>;

    explicit TtlCache(Clock::duration ttl, NowFn now = [] { return Clock::now(); })
        : ttl_(ttl), now_(std::move(now)) {}

    TtlCache(const TtlCache &) = delete;
    TtlCache &operator=(const TtlCache &) = delete;

    /**
     * @brief Return the cached value for `key`, computing it on a miss
     *
     * @return true with `value` set, or false with the compute failure in `errors`
     */
    bool get_or_compute(const Key &key, const ComputeFn &compute, Value &value, errors::ErrorStack &errors) {
        if (lookup(key, value)) {
            hits_++;
            return true;
        }
        misses_++;

        Value fresh{};
        if (!compute(fresh, errors)) {
            return false;
        }

        put(key, fresh);
        value = std::move(fresh);
        return true;
    }

    // Store a value computed elsewhere, restarting its TTL
    void put(const Key &key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{std::move(value), now_()};
    }

    // Non-computing lookup; true only for a live entry
    bool lookup(const Key &key, Value &value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || !is_live(it->second)) {
            return false;
        }
        value = it->second.value;
        return true;
    }

    // Physically drop expired entries; never called automatically
    size_t erase_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t erased = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (!is_live(it->second)) {
                it = entries_.erase(it);
                ++erased;
            } else {
                ++it;
            }
        }
        return erased;
    }

    // Physical entry count, expired-but-unswept entries included
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    Clock::duration ttl() const { return ttl_; }
    size_t hits() const { return hits_.load(); }
    size_t misses() const { return misses_.load(); }

private:
    struct Entry {
        Value value;
        Clock::time_point inserted;
    };

    bool is_live(const Entry &entry) const { return now_() - entry.inserted < ttl_; }

    const Clock::duration ttl_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::map<Key, Entry> entries_;

    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
};

}  // namespace cache
}  // namespace tangorest

#endif  // TANGOREST_CACHE_TTL_CACHE_HPP
