#include "bridge/attribute_bridge.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "mocks/mock_device_handle.hpp"

using namespace tangorest;
using namespace testing;
using namespace tangorest::tests;
using remote::DataType;
using remote::WriteType;

namespace {

AttributeDescriptor descriptor_for(const std::string &name, DataType type, WriteType writable) {
    AttributeDescriptor descriptor;
    descriptor.name = name;
    descriptor.data_type = type;
    descriptor.writable = writable;
    return descriptor;
}

}  // namespace

class AttributeBridgeTest : public Test {
protected:
    void SetUp() override { ON_CALL(handle, name()).WillByDefault(ReturnRef(handle._name)); }

    // Descriptor fetch returns one configured descriptor per requested name
    void ExpectDescriptors(const std::vector<AttributeDescriptor> &known) {
        EXPECT_CALL(handle, get_attribute_config(_, _, _))
            .WillOnce(Invoke([known](const StringList &names, std::vector<AttributeDescriptor> &out,
                                     errors::ErrorStack &) {
                out.clear();
                for (const auto &name : names) {
                    auto it = std::find_if(known.begin(), known.end(),
                                           [&name](const AttributeDescriptor &d) { return d.name == name; });
                    if (it != known.end()) {
                        out.push_back(*it);
                    }
                }
                return true;
            }));
    }

    // Remote that clamps doubles into [0, 10] and records the committed value
    void ClampingRemote(const std::string &attr) {
        ON_CALL(handle, write_attribute(attr, _, _))
            .WillByDefault(Invoke([this](const std::string &, const RemoteValue &value, errors::ErrorStack &) {
                committed = std::clamp(std::get<double>(value), 0.0, 10.0);
                return true;
            }));
        ON_CALL(handle, read_attribute(attr, _, _))
            .WillByDefault(Invoke([this](const std::string &name, AttributeReading &reading, errors::ErrorStack &) {
                reading.name = name;
                reading.value = committed;
                return true;
            }));
        ON_CALL(handle, write_read_attribute(attr, _, _, _))
            .WillByDefault(Invoke([this](const std::string &name, const RemoteValue &value, AttributeReading &reading,
                                         errors::ErrorStack &) {
                committed = std::clamp(std::get<double>(value), 0.0, 10.0);
                reading.name = name;
                reading.value = committed;
                return true;
            }));
    }

    NiceMock<MockDeviceHandle> handle;
    bridge::AttributeBridge bridge;
    double committed = 0.0;
};

TEST_F(AttributeBridgeTest, ReturnsCommittedValueNotRequested) {
    ExpectDescriptors({descriptor_for("Current", DataType::DEV_DOUBLE, WriteType::READ_WRITE)});
    ClampingRemote("Current");

    bridge::AttributeResult result;
    errors::ErrorStack errs;
    ASSERT_TRUE(bridge.write_attribute(handle, "Current", "25", result, errs));

    EXPECT_EQ(result.name, "Current");
    EXPECT_DOUBLE_EQ(std::get<double>(result.value), 10.0);
    EXPECT_TRUE(errs.empty());
}

TEST_F(AttributeBridgeTest, ReadWriteAttributesUseCombinedCall) {
    ExpectDescriptors({descriptor_for("Current", DataType::DEV_DOUBLE, WriteType::READ_WITH_WRITE)});
    ClampingRemote("Current");

    EXPECT_CALL(handle, write_read_attribute("Current", _, _, _)).Times(1);
    EXPECT_CALL(handle, write_attribute(_, _, _)).Times(0);
    EXPECT_CALL(handle, read_attribute(_, _, _)).Times(0);

    bridge::AttributeResult result;
    errors::ErrorStack errs;
    ASSERT_TRUE(bridge.write_attribute(handle, "Current", "2.5", result, errs));
    EXPECT_DOUBLE_EQ(std::get<double>(result.value), 2.5);
}

TEST_F(AttributeBridgeTest, WriteOnlyAttributesWriteThenRead) {
    ExpectDescriptors({descriptor_for("Setpoint", DataType::DEV_DOUBLE, WriteType::WRITE)});
    ClampingRemote("Setpoint");

    {
        InSequence seq;
        EXPECT_CALL(handle, write_attribute("Setpoint", _, _));
        EXPECT_CALL(handle, read_attribute("Setpoint", _, _));
    }
    EXPECT_CALL(handle, write_read_attribute(_, _, _, _)).Times(0);

    bridge::AttributeResult result;
    errors::ErrorStack errs;
    ASSERT_TRUE(bridge.write_attribute(handle, "Setpoint", "-4", result, errs));
    EXPECT_DOUBLE_EQ(std::get<double>(result.value), 0.0);
}

TEST_F(AttributeBridgeTest, CoercionFailureNeverReachesRemote) {
    ExpectDescriptors({descriptor_for("Current", DataType::DEV_DOUBLE, WriteType::READ_WRITE)});
    EXPECT_CALL(handle, write_read_attribute(_, _, _, _)).Times(0);
    EXPECT_CALL(handle, write_attribute(_, _, _)).Times(0);

    bridge::AttributeResult result;
    errors::ErrorStack errs;
    EXPECT_FALSE(bridge.write_attribute(handle, "Current", "ten", result, errs));

    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].reason, "ValueCoercionError");
    EXPECT_NE(errs[0].description.find("Current"), std::string::npos);
    EXPECT_NE(errs[0].description.find("DevDouble"), std::string::npos);
}

TEST_F(AttributeBridgeTest, ReadBackFailureFailsTheWrite) {
    ExpectDescriptors({descriptor_for("Setpoint", DataType::DEV_DOUBLE, WriteType::WRITE)});
    EXPECT_CALL(handle, write_attribute("Setpoint", _, _)).WillOnce(Return(true));
    EXPECT_CALL(handle, read_attribute("Setpoint", _, _))
        .WillOnce(Invoke([](const std::string &, AttributeReading &, errors::ErrorStack &errs) {
            errs.push_back(errors::ErrorRecord{"API_DeviceTimedOut", "Timeout (3000 mS) exceeded",
                                               errors::ErrorSeverity::ERR, "Connection::read_attribute"});
            return false;
        }));

    bridge::AttributeResult result;
    errors::ErrorStack errs;
    EXPECT_FALSE(bridge.write_attribute(handle, "Setpoint", "1", result, errs));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].reason, "API_DeviceTimedOut");
}

TEST_F(AttributeBridgeTest, FailedReadingIsNotReportedAsValue) {
    ExpectDescriptors({descriptor_for("Current", DataType::DEV_DOUBLE, WriteType::READ_WRITE)});
    EXPECT_CALL(handle, write_read_attribute("Current", _, _, _))
        .WillOnce(Invoke([](const std::string &, const RemoteValue &, AttributeReading &reading,
                            errors::ErrorStack &) {
            reading.has_failed = true;
            return true;
        }));

    bridge::AttributeResult result;
    errors::ErrorStack errs;
    EXPECT_FALSE(bridge.write_attribute(handle, "Current", "1", result, errs));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].reason, "RemoteCallError");
}

TEST_F(AttributeBridgeTest, EnumReadBackIsRenderedAsLabel) {
    auto mode = descriptor_for("Mode", DataType::DEV_ENUM, WriteType::READ_WRITE);
    mode.enum_labels = {"Off", "Low", "High"};
    ExpectDescriptors({mode});
    EXPECT_CALL(handle, write_read_attribute("Mode", RemoteValue{int64_t{2}}, _, _))
        .WillOnce(Invoke([](const std::string &name, const RemoteValue &value, AttributeReading &reading,
                            errors::ErrorStack &) {
            reading.name = name;
            reading.value = value;
            reading.w_value = value;
            return true;
        }));

    bridge::AttributeResult result;
    errors::ErrorStack errs;
    ASSERT_TRUE(bridge.write_attribute(handle, "Mode", "High", result, errs));
    EXPECT_EQ(std::get<std::string>(result.value), "High");
    ASSERT_TRUE(result.w_value.has_value());
    EXPECT_EQ(std::get<std::string>(*result.w_value), "High");
}

TEST_F(AttributeBridgeTest, WriteAttributesFetchesDescriptorsOnceAndKeepsOrder) {
    ExpectDescriptors({descriptor_for("A", DataType::DEV_DOUBLE, WriteType::READ_WRITE),
                       descriptor_for("B", DataType::DEV_DOUBLE, WriteType::READ_WRITE)});
    ClampingRemote("A");
    ClampingRemote("B");
    {
        InSequence seq;
        EXPECT_CALL(handle, write_read_attribute("B", _, _, _));
        EXPECT_CALL(handle, write_read_attribute("A", _, _, _));
    }

    std::vector<bridge::AttributeResult> results;
    errors::ErrorStack errs;
    ASSERT_TRUE(bridge.write_attributes(handle, {{"B", "3"}, {"A", "50"}}, results, errs));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].name, "B");
    EXPECT_DOUBLE_EQ(std::get<double>(results[1].value), 10.0);
}

TEST_F(AttributeBridgeTest, WriteAttributesStopsAtFirstFailure) {
    ExpectDescriptors({descriptor_for("A", DataType::DEV_LONG, WriteType::READ_WRITE),
                       descriptor_for("B", DataType::DEV_LONG, WriteType::READ_WRITE)});
    EXPECT_CALL(handle, write_read_attribute(_, _, _, _)).Times(0);

    std::vector<bridge::AttributeResult> results;
    errors::ErrorStack errs;
    EXPECT_FALSE(bridge.write_attributes(handle, {{"A", "1.5"}, {"B", "2"}}, results, errs));
    EXPECT_TRUE(results.empty());
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].reason, "ValueCoercionError");
}

TEST_F(AttributeBridgeTest, PlainReadRendersState) {
    EXPECT_CALL(handle, read_attribute("State", _, _))
        .WillOnce(Invoke([](const std::string &name, AttributeReading &reading, errors::ErrorStack &) {
            reading.name = name;
            reading.value = remote::DeviceState::ALARM;
            return true;
        }));

    bridge::AttributeResult result;
    errors::ErrorStack errs;
    ASSERT_TRUE(bridge.read_attribute(handle, "State", result, errs));
    EXPECT_EQ(std::get<std::string>(result.value), "ALARM");
}

TEST_F(AttributeBridgeTest, UpdateConfigAppliesParamsAndPushesDescriptor) {
    ExpectDescriptors({descriptor_for("Current", DataType::DEV_DOUBLE, WriteType::READ_WRITE)});
    EXPECT_CALL(handle, set_attribute_config(AllOf(Field(&AttributeDescriptor::unit, "mA"),
                                                   Field(&AttributeDescriptor::max_dim_x, 4)),
                                             _))
        .WillOnce(Return(true));

    AttributeDescriptor updated;
    errors::ErrorStack errs;
    ASSERT_TRUE(bridge.update_attribute_config(handle, "Current", {{"unit", "mA"}, {"max_dim_x", "4"}}, updated, errs));
    EXPECT_EQ(updated.unit, "mA");
}

TEST_F(AttributeBridgeTest, UpdateConfigRejectsUnknownParam) {
    ExpectDescriptors({descriptor_for("Current", DataType::DEV_DOUBLE, WriteType::READ_WRITE)});
    EXPECT_CALL(handle, set_attribute_config(_, _)).Times(0);

    AttributeDescriptor updated;
    errors::ErrorStack errs;
    EXPECT_FALSE(bridge.update_attribute_config(handle, "Current", {{"colour", "red"}}, updated, errs));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].reason, "ValueCoercionError");
}
