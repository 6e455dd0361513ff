#ifndef TANGOREST_REMOTE_REMOTE_TYPES_HPP
#define TANGOREST_REMOTE_REMOTE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tangorest {
namespace remote {

using StringList = std::vector<std::string>;

// Scalar type families declared by the remote system for an attribute
enum class DataType {
    DEV_BOOLEAN,
    DEV_SHORT,
    DEV_LONG,
    DEV_LONG64,
    DEV_USHORT,
    DEV_ULONG,
    DEV_ULONG64,
    DEV_UCHAR,
    DEV_FLOAT,
    DEV_DOUBLE,
    DEV_STRING,
    DEV_STATE,
    DEV_ENUM
};

enum class DataFormat { SCALAR, SPECTRUM, IMAGE };

// Writability class of an attribute
enum class WriteType { READ, READ_WRITE, READ_WITH_WRITE, WRITE };

enum class AttrQuality { VALID, INVALID, ALARM, CHANGING, WARNING };

enum class DisplayLevel { OPERATOR, EXPERT };

// Device states, in the remote system's numeric order
enum class DeviceState {
    ON,
    OFF,
    CLOSE,
    OPEN,
    INSERT,
    EXTRACT,
    MOVING,
    STANDBY,
    FAULT,
    INIT,
    RUNNING,
    ALARM,
    DISABLE,
    UNKNOWN
};

constexpr int kDeviceStateCount = 14;

/**
 * @brief Closed value type covering every remote primitive family
 *
 * Integer families of all widths share int64_t; the declared DataType
 * carries the range.
 */
using RemoteValue = std::variant<bool,                      // DevBoolean
                                 int64_t,                   // DevShort..DevULong64, DevUChar, DevEnum
                                 double,                    // DevFloat, DevDouble
                                 std::string,               // DevString
                                 DeviceState,               // DevState
                                 std::vector<bool>,         // spectrum of DevBoolean
                                 std::vector<int64_t>,      // spectrum of integers
                                 std::vector<double>,       // spectrum of floats
                                 std::vector<std::string>>;  // spectrum of strings

struct AttributeDescriptor {
    std::string name;
    DataType data_type = DataType::DEV_DOUBLE;
    DataFormat data_format = DataFormat::SCALAR;
    WriteType writable = WriteType::READ;
    std::string writable_attr_name;
    std::string label;
    std::string description;
    std::string unit;
    std::string standard_unit;
    std::string display_unit;
    std::string format;
    std::string min_value;
    std::string max_value;
    std::string min_alarm;
    std::string max_alarm;
    int max_dim_x = 1;
    int max_dim_y = 0;
    DisplayLevel disp_level = DisplayLevel::OPERATOR;
    StringList enum_labels;
    StringList extensions;
};

struct AttributeReading {
    std::string name;
    RemoteValue value;
    std::optional<RemoteValue> w_value;  // Set point, for writable attributes
    AttrQuality quality = AttrQuality::VALID;
    std::chrono::system_clock::time_point timestamp;
    bool has_failed = false;
};

struct CommandInfo {
    std::string cmd_name;
    int64_t cmd_tag = 0;
    std::string in_type;
    std::string out_type;
    std::string in_type_desc;
    std::string out_type_desc;
    DisplayLevel disp_level = DisplayLevel::OPERATOR;
};

struct DeviceInfo {
    std::string dev_class;
    std::string server_id;
    std::string server_host;
    std::string doc_url;
};

struct ImportInfo {
    std::string name;
    bool exported = false;
    std::string ior;
    std::string version;
};

// String renderings use the remote system's own spelling (e.g. "DevDouble", "READ_WRITE")
const char *data_type_to_string(DataType type);
std::optional<DataType> data_type_from_string(const std::string &name);

const char *data_format_to_string(DataFormat format);
std::optional<DataFormat> data_format_from_string(const std::string &name);

const char *write_type_to_string(WriteType type);
std::optional<WriteType> write_type_from_string(const std::string &name);

const char *quality_to_string(AttrQuality quality);

const char *display_level_to_string(DisplayLevel level);

const char *device_state_to_string(DeviceState state);
std::optional<DeviceState> device_state_from_string(const std::string &name);
std::optional<DeviceState> device_state_from_code(int64_t code);

bool is_integer_type(DataType type);
bool is_float_type(DataType type);

}  // namespace remote
}  // namespace tangorest

#endif  // TANGOREST_REMOTE_REMOTE_TYPES_HPP
