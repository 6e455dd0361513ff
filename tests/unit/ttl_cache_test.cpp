#include "cache/ttl_cache.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace tangorest;
using namespace std::chrono_literals;

class TtlCacheTest : public ::testing::Test {
protected:
    using Cache = cache::TtlCache<std::vector<std::string>, std::string>;

    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point{} + 1h;

    Cache make_cache(std::chrono::steady_clock::duration ttl = 10s) {
        return Cache(ttl, [this] { return now; });
    }

    // Compute callback that counts its invocations
    Cache::ComputeFn counting(int &calls, const std::string &value) {
        return [&calls, value](std::string &out, errors::ErrorStack &) {
            ++calls;
            out = value;
            return true;
        };
    }
};

TEST_F(TtlCacheTest, RepeatedCallsWithinTtlComputeOnce) {
    auto cache = make_cache();
    int calls = 0;
    errors::ErrorStack errs;
    std::string value;

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(cache.get_or_compute({"a/b/c"}, counting(calls, "first"), value, errs));
        EXPECT_EQ(value, "first");
        now += 1s;
    }

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cache.hits(), 4u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST_F(TtlCacheTest, RecomputesOnceTtlHasElapsed) {
    auto cache = make_cache();
    int calls = 0;
    errors::ErrorStack errs;
    std::string value;

    ASSERT_TRUE(cache.get_or_compute({"k"}, counting(calls, "v1"), value, errs));
    now += 9s;
    ASSERT_TRUE(cache.get_or_compute({"k"}, counting(calls, "v2"), value, errs));
    EXPECT_EQ(value, "v1");

    // Entries live while now - inserted < ttl
    now += 1s;
    ASSERT_TRUE(cache.get_or_compute({"k"}, counting(calls, "v2"), value, errs));
    EXPECT_EQ(value, "v2");
    EXPECT_EQ(calls, 2);
}

TEST_F(TtlCacheTest, DistinctKeysAreIndependent) {
    auto cache = make_cache();
    int calls = 0;
    errors::ErrorStack errs;
    std::string value;

    ASSERT_TRUE(cache.get_or_compute({"a", "1"}, counting(calls, "x"), value, errs));
    ASSERT_TRUE(cache.get_or_compute({"a", "2"}, counting(calls, "y"), value, errs));
    EXPECT_EQ(value, "y");
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(TtlCacheTest, FailuresAreNeverCached) {
    auto cache = make_cache();
    int failures = 0;
    errors::ErrorStack errs;
    std::string value;

    auto failing = [&failures](std::string &, errors::ErrorStack &errors) {
        ++failures;
        errors.push_back(errors::ErrorRecord{"API_DeviceTimedOut", "timeout", errors::ErrorSeverity::ERR, "test"});
        return false;
    };

    EXPECT_FALSE(cache.get_or_compute({"k"}, failing, value, errs));
    EXPECT_FALSE(cache.get_or_compute({"k"}, failing, value, errs));
    EXPECT_EQ(failures, 2);
    EXPECT_EQ(errs.size(), 2u);
    EXPECT_EQ(cache.size(), 0u);

    int calls = 0;
    errs.clear();
    ASSERT_TRUE(cache.get_or_compute({"k"}, counting(calls, "ok"), value, errs));
    EXPECT_EQ(value, "ok");
    EXPECT_TRUE(errs.empty());
}

TEST_F(TtlCacheTest, PutRestartsTtl) {
    auto cache = make_cache();
    int calls = 0;
    errors::ErrorStack errs;
    std::string value;

    ASSERT_TRUE(cache.get_or_compute({"k"}, counting(calls, "old"), value, errs));
    now += 8s;
    cache.put({"k"}, "new");
    now += 8s;

    ASSERT_TRUE(cache.lookup({"k"}, value));
    EXPECT_EQ(value, "new");
    EXPECT_EQ(calls, 1);
}

TEST_F(TtlCacheTest, EraseExpiredDropsOnlyDeadEntries) {
    auto cache = make_cache();
    cache.put({"old"}, "1");
    now += 5s;
    cache.put({"young"}, "2");
    now += 6s;

    EXPECT_EQ(cache.erase_expired(), 1u);
    EXPECT_EQ(cache.size(), 1u);

    std::string value;
    EXPECT_FALSE(cache.lookup({"old"}, value));
    EXPECT_TRUE(cache.lookup({"young"}, value));
}
