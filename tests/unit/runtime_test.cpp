#include "runtime/runtime.hpp"

#include <gtest/gtest.h>

#include "sim_test_config.hpp"

using namespace tangorest;
using namespace tangorest::tests;

class RuntimeTest : public ::testing::Test {
protected:
    runtime::ServiceConfig make_config() {
        runtime::ServiceConfig config;
        config.cache.ttl_seconds = 0.5;
        config.pool.max_handles = 2;
        config.simulation = power_supply_config();
        return config;
    }
};

TEST_F(RuntimeTest, InitializesAndHandlesRequests) {
    runtime::Runtime rt(make_config());
    std::string error;
    ASSERT_TRUE(rt.initialize(error)) << error;

    auto result = rt.handle(service::Request{"get_state", "a/b/c", {}});
    ASSERT_TRUE(result.success) << result.to_json().dump();
    EXPECT_EQ(result.data["state"], "ON");

    EXPECT_EQ(rt.get_context().pool().max_size(), 2u);
    EXPECT_EQ(rt.get_context().directory().ttl(), std::chrono::milliseconds(500));
}

TEST_F(RuntimeTest, DirectoryDeviceIsReachable) {
    runtime::Runtime rt(make_config());
    std::string error;
    ASSERT_TRUE(rt.initialize(error)) << error;

    auto result = rt.handle(service::Request{"get_device", "sys/database/2", {}});
    ASSERT_TRUE(result.success) << result.to_json().dump();
    EXPECT_EQ(result.data["info"]["classname"], "DataBase");
}

TEST_F(RuntimeTest, InvalidSimulationFailsInitialize) {
    auto config = make_config();
    config.simulation.devices[0].state = "BROKEN";

    runtime::Runtime rt(config);
    std::string error;
    EXPECT_FALSE(rt.initialize(error));
    EXPECT_NE(error.find("BROKEN"), std::string::npos);
}

TEST_F(RuntimeTest, UninitializedRuntimeRejectsRequests) {
    runtime::Runtime rt(make_config());
    auto result = rt.handle(service::Request{"list_devices", "", {}});
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.to_json()["errors"][0]["reason"], "InvalidRequestError");
}
