#include "remote_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace tangorest {
namespace remote {

namespace {

const std::array<std::pair<DataType, const char *>, 13> kDataTypeNames = {{
    {DataType::DEV_BOOLEAN, "DevBoolean"},
    {DataType::DEV_SHORT, "DevShort"},
    {DataType::DEV_LONG, "DevLong"},
    {DataType::DEV_LONG64, "DevLong64"},
    {DataType::DEV_USHORT, "DevUShort"},
    {DataType::DEV_ULONG, "DevULong"},
    {DataType::DEV_ULONG64, "DevULong64"},
    {DataType::DEV_UCHAR, "DevUChar"},
    {DataType::DEV_FLOAT, "DevFloat"},
    {DataType::DEV_DOUBLE, "DevDouble"},
    {DataType::DEV_STRING, "DevString"},
    {DataType::DEV_STATE, "DevState"},
    {DataType::DEV_ENUM, "DevEnum"},
}};

const std::array<const char *, kDeviceStateCount> kStateNames = {
    "ON", "OFF", "CLOSE", "OPEN", "INSERT", "EXTRACT", "MOVING",
    "STANDBY", "FAULT", "INIT", "RUNNING", "ALARM", "DISABLE", "UNKNOWN"};

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

}  // namespace

const char *data_type_to_string(DataType type) {
    for (const auto &[value, name] : kDataTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<DataType> data_type_from_string(const std::string &name) {
    // Accepts both "DevDouble" and the short config spelling "double"
    const std::string upper = to_upper(name);
    for (const auto &[value, type_name] : kDataTypeNames) {
        std::string full = to_upper(type_name);
        if (upper == full || "DEV" + upper == full) {
            return value;
        }
    }
    return std::nullopt;
}

const char *data_format_to_string(DataFormat format) {
    switch (format) {
        case DataFormat::SCALAR:
            return "SCALAR";
        case DataFormat::SPECTRUM:
            return "SPECTRUM";
        case DataFormat::IMAGE:
            return "IMAGE";
        default:
            return "SCALAR";
    }
}

std::optional<DataFormat> data_format_from_string(const std::string &name) {
    const std::string upper = to_upper(name);
    if (upper == "SCALAR") return DataFormat::SCALAR;
    if (upper == "SPECTRUM") return DataFormat::SPECTRUM;
    if (upper == "IMAGE") return DataFormat::IMAGE;
    return std::nullopt;
}

const char *write_type_to_string(WriteType type) {
    switch (type) {
        case WriteType::READ:
            return "READ";
        case WriteType::READ_WRITE:
            return "READ_WRITE";
        case WriteType::READ_WITH_WRITE:
            return "READ_WITH_WRITE";
        case WriteType::WRITE:
            return "WRITE";
        default:
            return "READ";
    }
}

std::optional<WriteType> write_type_from_string(const std::string &name) {
    const std::string upper = to_upper(name);
    if (upper == "READ") return WriteType::READ;
    if (upper == "READ_WRITE") return WriteType::READ_WRITE;
    if (upper == "READ_WITH_WRITE") return WriteType::READ_WITH_WRITE;
    if (upper == "WRITE") return WriteType::WRITE;
    return std::nullopt;
}

const char *quality_to_string(AttrQuality quality) {
    switch (quality) {
        case AttrQuality::VALID:
            return "ATTR_VALID";
        case AttrQuality::INVALID:
            return "ATTR_INVALID";
        case AttrQuality::ALARM:
            return "ATTR_ALARM";
        case AttrQuality::CHANGING:
            return "ATTR_CHANGING";
        case AttrQuality::WARNING:
            return "ATTR_WARNING";
        default:
            return "ATTR_INVALID";
    }
}

const char *display_level_to_string(DisplayLevel level) {
    return level == DisplayLevel::EXPERT ? "EXPERT" : "OPERATOR";
}

const char *device_state_to_string(DeviceState state) {
    auto index = static_cast<size_t>(state);
    if (index >= kStateNames.size()) {
        return "UNKNOWN";
    }
    return kStateNames[index];
}

std::optional<DeviceState> device_state_from_string(const std::string &name) {
    const std::string upper = to_upper(name);
    for (size_t i = 0; i < kStateNames.size(); ++i) {
        if (upper == kStateNames[i]) {
            return static_cast<DeviceState>(i);
        }
    }
    return std::nullopt;
}

std::optional<DeviceState> device_state_from_code(int64_t code) {
    if (code < 0 || code >= kDeviceStateCount) {
        return std::nullopt;
    }
    return static_cast<DeviceState>(code);
}

bool is_integer_type(DataType type) {
    switch (type) {
        case DataType::DEV_SHORT:
        case DataType::DEV_LONG:
        case DataType::DEV_LONG64:
        case DataType::DEV_USHORT:
        case DataType::DEV_ULONG:
        case DataType::DEV_ULONG64:
        case DataType::DEV_UCHAR:
            return true;
        default:
            return false;
    }
}

bool is_float_type(DataType type) { return type == DataType::DEV_FLOAT || type == DataType::DEV_DOUBLE; }

}  // namespace remote
}  // namespace tangorest
