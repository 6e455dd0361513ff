#include "service/device_service.hpp"

#include <gtest/gtest.h>

#include <string>

#include "sim_test_config.hpp"

using namespace tangorest;
using namespace tangorest::tests;
using remote::DirectoryOp;
using nlohmann::json;

class DeviceServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(harness.loaded) << harness.load_error;
        service = std::make_unique<service::DeviceService>(*harness.context);
    }

    static remote::EntityId id(const std::string &name) { return *remote::EntityId::parse(name); }

    static std::string first_reason(const service::ServiceResult &result) {
        auto envelope = result.to_json();
        return envelope["errors"].empty() ? std::string() : envelope["errors"][0]["reason"].get<std::string>();
    }

    SimHarness harness;
    std::unique_ptr<service::DeviceService> service;
};

TEST_F(DeviceServiceTest, ListDevicesIncludesDirectory) {
    auto result = service->list_devices();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data, json::parse(R"([{"name": "a/b/c"}, {"name": "sys/database/2"}])"));
}

TEST_F(DeviceServiceTest, ListDevicesIsServedFromCache) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(service->list_devices("a/*").success);
    }
    EXPECT_EQ(harness.directory->call_count(DirectoryOp::GET_DEVICE_WIDE_LIST), 1u);
}

TEST_F(DeviceServiceTest, GetDeviceCombinesEverySource) {
    auto result = service->get_device(id("a/b/c"));
    ASSERT_TRUE(result.success) << result.to_json().dump();

    const auto &data = result.data;
    EXPECT_EQ(data["name"], "a/b/c");
    EXPECT_EQ(data["state"], "ON");
    EXPECT_EQ(data["status"], "The device is in ON state.");
    EXPECT_EQ(data["info"]["classname"], "PowerSupply");
    EXPECT_EQ(data["info"]["server"], "PowerSupply/1");
    EXPECT_EQ(data["info"]["hostname"], "host1");
    EXPECT_EQ(data["info"]["exported"], true);
    EXPECT_EQ(data["info"]["is_taco"], false);
    EXPECT_EQ(data["attributes"][0], "State");
    EXPECT_EQ(data["attributes"][1], "Status");
    EXPECT_EQ(data["attributes"].size(), 7u);
    EXPECT_EQ(data["commands"], json::parse(R"(["On", "Off"])"));
    EXPECT_EQ(data["properties"], json::parse(R"(["Description", "Limits"])"));
}

TEST_F(DeviceServiceTest, UnknownDeviceFailsToConnect) {
    auto result = service->get_device_state(id("x/y/z"));
    ASSERT_FALSE(result.success);
    EXPECT_EQ(first_reason(result), "API_DeviceNotDefined");
    EXPECT_EQ(result.to_json()["quality"], "FAILURE");
}

TEST_F(DeviceServiceTest, HandlesAreReusedAcrossOperations) {
    ASSERT_TRUE(service->get_device_state(id("a/b/c")).success);
    ASSERT_TRUE(service->list_attributes(id("a/b/c")).success);
    ASSERT_TRUE(service->list_commands(id("a/b/c")).success);
    EXPECT_EQ(harness.connector->connect_count(), 1u);
}

TEST_F(DeviceServiceTest, ReadAttributesKeyedByName) {
    auto result = service->read_attributes(id("a/b/c"), {"State", "Current", "Mode"});
    ASSERT_TRUE(result.success) << result.to_json().dump();
    EXPECT_EQ(result.data["State"]["value"], "ON");
    EXPECT_DOUBLE_EQ(result.data["Current"]["value"].get<double>(), 1.5);
    EXPECT_DOUBLE_EQ(result.data["Current"]["w_value"].get<double>(), 1.5);
    EXPECT_EQ(result.data["Current"]["quality"], "ATTR_VALID");
    // Plain reads leave enum indices alone
    EXPECT_EQ(result.data["Mode"]["value"], 1);
}

TEST_F(DeviceServiceTest, WriteReturnsClampedValue) {
    auto result = service->write_attribute(id("a/b/c"), "Current", "25");
    ASSERT_TRUE(result.success) << result.to_json().dump();
    EXPECT_EQ(result.data["name"], "Current");
    EXPECT_DOUBLE_EQ(result.data["value"].get<double>(), 10.0);

    auto read = service->read_attribute(id("a/b/c"), "Current");
    ASSERT_TRUE(read.success);
    EXPECT_DOUBLE_EQ(read.data["value"].get<double>(), 10.0);
}

TEST_F(DeviceServiceTest, WriteOnlyAttributeIsReadBack) {
    auto result = service->write_attribute(id("a/b/c"), "Setpoint", "-12.5");
    ASSERT_TRUE(result.success) << result.to_json().dump();
    EXPECT_DOUBLE_EQ(result.data["value"].get<double>(), -5.0);
}

TEST_F(DeviceServiceTest, EnumWriteReturnsLabel) {
    auto result = service->write_attribute(id("a/b/c"), "Mode", "2");
    ASSERT_TRUE(result.success) << result.to_json().dump();
    EXPECT_EQ(result.data["value"], "High");
}

TEST_F(DeviceServiceTest, SpectrumWriteClampsElements) {
    auto result = service->write_attribute(id("a/b/c"), "Counts", "[5, 500, 7]");
    ASSERT_TRUE(result.success) << result.to_json().dump();
    EXPECT_EQ(result.data["value"], json::parse("[5, 100, 7]"));
}

TEST_F(DeviceServiceTest, WriteToReadOnlyAttributeFails) {
    auto result = service->write_attribute(id("a/b/c"), "Voltage", "1");
    ASSERT_FALSE(result.success);
    EXPECT_EQ(first_reason(result), "API_AttrNotWritable");
}

TEST_F(DeviceServiceTest, UnconvertibleValueFails) {
    auto result = service->write_attribute(id("a/b/c"), "Current", "lots");
    ASSERT_FALSE(result.success);
    EXPECT_EQ(first_reason(result), "ValueCoercionError");
}

TEST_F(DeviceServiceTest, WriteAttributesInRequestOrder) {
    auto result = service->write_attributes(id("a/b/c"), {{"Mode", "Off"}, {"Current", "3"}});
    ASSERT_TRUE(result.success) << result.to_json().dump();
    ASSERT_EQ(result.data.size(), 2u);
    EXPECT_EQ(result.data[0]["name"], "Mode");
    EXPECT_EQ(result.data[0]["value"], "Off");
    EXPECT_DOUBLE_EQ(result.data[1]["value"].get<double>(), 3.0);
}

TEST_F(DeviceServiceTest, AttributeInfoAndUpdate) {
    auto info = service->get_attribute_info(id("a/b/c"), "Current");
    ASSERT_TRUE(info.success);
    EXPECT_EQ(info.data["data_type"], "DevDouble");
    EXPECT_EQ(info.data["writable"], "READ_WRITE");
    EXPECT_EQ(info.data["unit"], "A");

    auto updated = service->update_attribute_info(id("a/b/c"), "Current", {{"unit", "mA"}, {"label", "I"}});
    ASSERT_TRUE(updated.success) << updated.to_json().dump();
    EXPECT_EQ(updated.data["unit"], "mA");

    auto reread = service->get_attribute_info(id("a/b/c"), "Current");
    EXPECT_EQ(reread.data["label"], "I");
}

TEST_F(DeviceServiceTest, PropertiesDecodeFromDirectory) {
    auto result = service->get_device_properties(id("a/b/c"));
    ASSERT_TRUE(result.success) << result.to_json().dump();
    EXPECT_EQ(result.data, json::parse(R"([
        {"name": "Description", "values": ["a calibrated sensor"]},
        {"name": "Limits", "values": ["0", "100"]}
    ])"));

    ASSERT_TRUE(service->get_device_properties(id("a/b/c")).success);
    EXPECT_EQ(harness.directory->call_count(DirectoryOp::GET_DEVICE_PROPERTY_LIST), 1u);
    EXPECT_EQ(harness.directory->call_count(DirectoryOp::GET_DEVICE_PROPERTY), 1u);
}

TEST_F(DeviceServiceTest, NoMatchingPropertiesGivesEmptyList) {
    auto result = service->get_device_properties(id("a/b/c"), "Nothing*");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data, json::array());
    EXPECT_EQ(harness.directory->call_count(DirectoryOp::GET_DEVICE_PROPERTY), 0u);
}

TEST_F(DeviceServiceTest, PutPropertyReadsBackFreshValues) {
    ASSERT_TRUE(service->get_device_property(id("a/b/c"), "Limits").success);

    auto put = service->put_device_property(id("a/b/c"), "Limits", {"5", "50"});
    ASSERT_TRUE(put.success) << put.to_json().dump();
    EXPECT_EQ(put.data, json::parse(R"([{"name": "Limits", "values": ["5", "50"]}])"));

    // The read back refreshed the cached entry
    auto get = service->get_device_property(id("a/b/c"), "Limits");
    EXPECT_EQ(get.data[0]["values"], json::parse(R"(["5", "50"])"));
    EXPECT_EQ(harness.directory->call_count(DirectoryOp::PUT_DEVICE_PROPERTY), 1u);
    EXPECT_EQ(harness.directory->call_count(DirectoryOp::GET_DEVICE_PROPERTY), 2u);
}

TEST_F(DeviceServiceTest, MissingPropertyHasNoValues) {
    auto result = service->get_device_property(id("a/b/c"), "Unknown");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data, json::parse(R"([{"name": "Unknown", "values": []}])"));
}

TEST_F(DeviceServiceTest, DeletePropertyAlwaysReachesDirectory) {
    auto result = service->delete_device_property(id("a/b/c"), "Description");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data, json::array());
    ASSERT_TRUE(service->delete_device_property(id("a/b/c"), "Description").success);
    EXPECT_EQ(harness.directory->call_count(DirectoryOp::DELETE_DEVICE_PROPERTY), 2u);

    remote::StringList names;
    errors::ErrorStack errs;
    ASSERT_TRUE(harness.system->property_names("a/b/c", "*", names, errs));
    EXPECT_EQ(names, remote::StringList{"Limits"});
}

TEST_F(DeviceServiceTest, OtherPropertyQueriesStayCachedUntilExpiry) {
    ASSERT_TRUE(service->get_device_property(id("a/b/c"), "Limits").success);
    ASSERT_TRUE(service->get_device_properties(id("a/b/c")).success);

    // Batch put refreshes only the [device, Limits, Unit] read back
    codec::PropertyList update = {{"Limits", {"5", "50"}}, {"Unit", {"mA"}}};
    auto put = service->put_device_properties(id("a/b/c"), update);
    ASSERT_TRUE(put.success) << put.to_json().dump();
    EXPECT_EQ(put.data, json::parse(R"([
        {"name": "Limits", "values": ["5", "50"]},
        {"name": "Unit", "values": ["mA"]}
    ])"));

    auto single = service->get_device_property(id("a/b/c"), "Limits");
    EXPECT_EQ(single.data[0]["values"], json::parse(R"(["0", "100"])"));
    auto listed = service->get_device_properties(id("a/b/c"));
    EXPECT_EQ(listed.data.size(), 2u);

    ASSERT_TRUE(service->delete_device_property(id("a/b/c"), "Description").success);
    EXPECT_EQ(service->get_device_properties(id("a/b/c")).data.size(), 2u);

    harness.now += std::chrono::seconds(10);

    single = service->get_device_property(id("a/b/c"), "Limits");
    EXPECT_EQ(single.data[0]["values"], json::parse(R"(["5", "50"])"));
    EXPECT_EQ(service->get_device_properties(id("a/b/c")).data, json::parse(R"([
        {"name": "Limits", "values": ["5", "50"]},
        {"name": "Unit", "values": ["mA"]}
    ])"));
}

TEST_F(DeviceServiceTest, PropertiesOfUnknownDeviceFail) {
    auto result = service->get_device_properties(id("x/y/z"));
    ASSERT_FALSE(result.success);
    EXPECT_EQ(first_reason(result), "DB_DeviceNotDefined");
}

TEST_F(DeviceServiceTest, ListCommandsShape) {
    auto result = service->list_commands(id("a/b/c"));
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.data.size(), 2u);
    EXPECT_EQ(result.data[0]["name"], "On");
    EXPECT_EQ(result.data[0]["info"]["in_type"], "DevVoid");
    EXPECT_EQ(result.data[1]["info"]["cmd_tag"], 1);
}
