#include "sim_system.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

#include "bridge/value_coercion.hpp"
#include "codec/property_codec.hpp"
#include "logging/logger.hpp"

namespace tangorest {
namespace sim {

using errors::ErrorRecord;
using errors::ErrorSeverity;
using errors::ErrorStack;
using remote::DataFormat;
using remote::DataType;
using remote::DirectoryOp;
using remote::RemoteValue;

namespace {

void remote_error(ErrorStack &errors, const std::string &reason, const std::string &description, const char *origin) {
    errors.push_back(ErrorRecord{reason, description, ErrorSeverity::ERR, origin});
}

std::string format_now() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::string default_text(const remote::AttributeDescriptor &descriptor) {
    if (descriptor.data_format != DataFormat::SCALAR) {
        return "[]";
    }
    switch (descriptor.data_type) {
        case DataType::DEV_BOOLEAN:
            return "false";
        case DataType::DEV_STRING:
            return "";
        case DataType::DEV_STATE:
            return "UNKNOWN";
        default:
            return "0";
    }
}

double clamp_to(double v, const std::optional<double> &min, const std::optional<double> &max) {
    if (min && v < *min) v = *min;
    if (max && v > *max) v = *max;
    return v;
}

int64_t clamp_to(int64_t v, const std::optional<double> &min, const std::optional<double> &max) {
    if (min && static_cast<double>(v) < *min) v = static_cast<int64_t>(std::ceil(*min));
    if (max && static_cast<double>(v) > *max) v = static_cast<int64_t>(std::floor(*max));
    return v;
}

RemoteValue clamp_value(const RemoteValue &value, const SimAttribute &attribute) {
    return std::visit(
        [&attribute](auto &&arg) -> RemoteValue {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
                return clamp_to(arg, attribute.min, attribute.max);
            } else if constexpr (std::is_same_v<T, std::vector<int64_t>> || std::is_same_v<T, std::vector<double>>) {
                T out;
                out.reserve(arg.size());
                for (auto element : arg) {
                    out.push_back(clamp_to(element, attribute.min, attribute.max));
                }
                return out;
            } else {
                return arg;
            }
        },
        value);
}

bool build_attribute(const SimAttributeConfig &config, SimAttribute &attribute, std::string &error) {
    auto &descriptor = attribute.descriptor;
    descriptor.name = config.name;
    descriptor.label = config.label.empty() ? config.name : config.label;
    descriptor.unit = config.unit;
    descriptor.enum_labels = config.enum_labels;
    descriptor.max_dim_x = config.max_dim_x;

    auto type = remote::data_type_from_string(config.type);
    if (!type) {
        error = "Attribute '" + config.name + "' has unknown type '" + config.type + "'";
        return false;
    }
    descriptor.data_type = *type;

    auto format = remote::data_format_from_string(config.format);
    if (!format || *format == DataFormat::IMAGE) {
        error = "Attribute '" + config.name + "' has unsupported format '" + config.format + "'";
        return false;
    }
    descriptor.data_format = *format;

    auto writable = remote::write_type_from_string(config.writable);
    if (!writable) {
        error = "Attribute '" + config.name + "' has unknown writable class '" + config.writable + "'";
        return false;
    }
    descriptor.writable = *writable;
    if (descriptor.writable != remote::WriteType::READ) {
        descriptor.writable_attr_name = config.name;
    }

    attribute.min = config.min;
    attribute.max = config.max;
    if (config.min) descriptor.min_value = std::to_string(*config.min);
    if (config.max) descriptor.max_value = std::to_string(*config.max);

    const std::string text = config.value.empty() ? default_text(descriptor) : config.value;
    std::string coercion_error;
    if (!bridge::coerce_value(text, descriptor, attribute.value, coercion_error)) {
        error = "Attribute '" + config.name + "' initial value: " + coercion_error;
        return false;
    }
    if (descriptor.writable != remote::WriteType::READ) {
        attribute.w_value = attribute.value;
    }
    attribute.updated = std::chrono::system_clock::now();
    return true;
}

void add_builtin(SimDevice &device, const std::string &name, DataType type, RemoteValue value) {
    SimAttribute attribute;
    attribute.descriptor.name = name;
    attribute.descriptor.label = name;
    attribute.descriptor.data_type = type;
    attribute.descriptor.writable = remote::WriteType::READ;
    attribute.value = std::move(value);
    attribute.updated = std::chrono::system_clock::now();
    device.attribute_order.push_back(name);
    device.attributes[name] = std::move(attribute);
}

void fill_reading(const std::string &attr, const SimAttribute &attribute, remote::AttributeReading &reading) {
    reading.name = attr;
    reading.value = attribute.value;
    reading.w_value = attribute.w_value;
    reading.quality = remote::AttrQuality::VALID;
    reading.timestamp = attribute.updated;
    reading.has_failed = false;
}

// Caller holds the system mutex
bool commit_write(const std::string &attr, SimAttribute &attribute, const RemoteValue &value, ErrorStack &errors,
                  const char *origin) {
    if (attribute.descriptor.writable == remote::WriteType::READ) {
        remote_error(errors, "API_AttrNotWritable", "Attribute " + attr + " is not writable", origin);
        return false;
    }
    if (value.index() != attribute.value.index()) {
        remote_error(errors, "API_IncompatibleAttrDataType",
                     "Incompatible data type for attribute " + attr + ": got " + bridge::value_type_name(value) +
                         ", expected " + bridge::value_type_name(attribute.value),
                     origin);
        return false;
    }

    attribute.value = clamp_value(value, attribute);
    attribute.w_value = attribute.value;
    attribute.updated = std::chrono::system_clock::now();
    return true;
}

}  // namespace

bool wildcard_match(const std::string &pattern, const std::string &text) {
    size_t p = 0;
    size_t t = 0;
    size_t star = std::string::npos;
    size_t resume = 0;
    auto same = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    };
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (p < pattern.size() && same(pattern[p], text[t])) {
            ++p;
            ++t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool SimSystem::load(const SimulationConfig &config, const std::string &directory_device, std::string &error) {
    std::map<std::string, SimDevice> devices;
    const std::string started = format_now();
    int64_t next_pid = 1000;

    auto make_device = [&](const SimDeviceConfig &device_config, SimDevice &device) {
        device.name = device_config.name;
        device.class_name = device_config.class_name;
        device.server = device_config.server;
        device.host = device_config.host;
        device.exported = device_config.exported;
        device.pid = next_pid++;
        device.started_date = started;
        device.properties = device_config.properties;

        auto state = remote::device_state_from_string(device_config.state);
        if (!state) {
            error = "Device '" + device_config.name + "' has unknown state '" + device_config.state + "'";
            return false;
        }
        std::string status = device_config.status.empty()
                                 ? "The device is in " + std::string(remote::device_state_to_string(*state)) + " state."
                                 : device_config.status;
        add_builtin(device, "State", DataType::DEV_STATE, *state);
        add_builtin(device, "Status", DataType::DEV_STRING, status);

        for (const auto &attribute_config : device_config.attributes) {
            if (device.attributes.count(attribute_config.name) > 0) {
                error = "Device '" + device_config.name + "' defines attribute '" + attribute_config.name + "' twice";
                return false;
            }
            SimAttribute attribute;
            if (!build_attribute(attribute_config, attribute, error)) {
                error = "Device '" + device_config.name + "': " + error;
                return false;
            }
            device.attribute_order.push_back(attribute_config.name);
            device.attributes[attribute_config.name] = std::move(attribute);
        }

        int64_t tag = 0;
        for (const auto &command_config : device_config.commands) {
            remote::CommandInfo command;
            command.cmd_name = command_config.name;
            command.cmd_tag = tag++;
            command.in_type = command_config.in_type;
            command.out_type = command_config.out_type;
            command.in_type_desc = command_config.in_type_desc;
            command.out_type_desc = command_config.out_type_desc;
            device.commands.push_back(std::move(command));
        }
        return true;
    };

    SimDeviceConfig directory_config;
    directory_config.name = directory_device;
    directory_config.class_name = "DataBase";
    directory_config.server = "DataBaseds/2";
    directory_config.status = "Device is OK";
    SimDevice directory;
    if (!make_device(directory_config, directory)) {
        return false;
    }
    devices[directory.name] = std::move(directory);

    for (const auto &device_config : config.devices) {
        if (devices.count(device_config.name) > 0) {
            error = "Device '" + device_config.name + "' defined twice";
            return false;
        }
        SimDevice device;
        if (!make_device(device_config, device)) {
            return false;
        }
        devices[device.name] = std::move(device);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = std::move(devices);
    LOG_INFO("[SimSystem] Loaded " << devices_.size() << " devices");
    return true;
}

const SimDevice *SimSystem::find_device(const std::string &device, ErrorStack &errors, const char *origin) const {
    auto it = devices_.find(device);
    if (it == devices_.end()) {
        remote_error(errors, "DB_DeviceNotDefined", "device " + device + " not defined in the database", origin);
        return nullptr;
    }
    return &it->second;
}

SimDevice *SimSystem::find_device(const std::string &device, ErrorStack &errors, const char *origin) {
    auto it = devices_.find(device);
    if (it == devices_.end()) {
        remote_error(errors, "DB_DeviceNotDefined", "device " + device + " not defined in the database", origin);
        return nullptr;
    }
    return &it->second;
}

bool SimSystem::directory_execute(DirectoryOp op, const remote::StringList &args, remote::DirectoryReply &reply,
                                  ErrorStack &errors) {
    const char *origin = remote::directory_op_traits(op).wire_name;
    std::lock_guard<std::mutex> lock(mutex_);
    reply = remote::DirectoryReply{};

    switch (op) {
        case DirectoryOp::GET_DEVICE_WIDE_LIST: {
            const std::string wildcard = args.empty() ? "*" : args[0];
            for (const auto &[name, device] : devices_) {
                if (wildcard_match(wildcard, name)) {
                    reply.strings.push_back(name);
                }
            }
            return true;
        }
        case DirectoryOp::GET_DEVICE_INFO: {
            if (args.empty()) {
                remote_error(errors, "DB_IncorrectArguments", "device name missing", origin);
                return false;
            }
            const SimDevice *device = find_device(args[0], errors, origin);
            if (device == nullptr) {
                return false;
            }
            reply.strings = {device->name,   "IOR:sim:" + device->name, "5", device->server,
                             device->host,   device->started_date,      device->stopped_date,
                             device->class_name};
            reply.longs = {device->exported ? 1 : 0, device->pid};
            return true;
        }
        case DirectoryOp::GET_DEVICE_PROPERTY_LIST: {
            if (args.size() < 2) {
                remote_error(errors, "DB_IncorrectArguments", "expected device and wildcard", origin);
                return false;
            }
            const SimDevice *device = find_device(args[0], errors, origin);
            if (device == nullptr) {
                return false;
            }
            for (const auto &[name, values] : device->properties) {
                if (wildcard_match(args[1], name)) {
                    reply.strings.push_back(name);
                }
            }
            return true;
        }
        case DirectoryOp::GET_DEVICE_PROPERTY: {
            if (args.empty()) {
                remote_error(errors, "DB_IncorrectArguments", "device name missing", origin);
                return false;
            }
            const SimDevice *device = find_device(args[0], errors, origin);
            if (device == nullptr) {
                return false;
            }
            codec::PropertyList properties;
            for (size_t i = 1; i < args.size(); ++i) {
                auto it = device->properties.find(args[i]);
                properties.push_back(codec::PropertyRecord{
                    args[i], it == device->properties.end() ? std::vector<std::string>{} : it->second});
            }
            reply.strings = codec::encode_device_properties(device->name, properties);
            return true;
        }
        case DirectoryOp::PUT_DEVICE_PROPERTY: {
            if (args.empty()) {
                remote_error(errors, "DB_IncorrectArguments", "device name missing", origin);
                return false;
            }
            SimDevice *device = find_device(args[0], errors, origin);
            if (device == nullptr) {
                return false;
            }
            codec::PropertyList properties;
            if (!codec::decode_device_properties(args, properties, errors)) {
                return false;
            }
            for (const auto &property : properties) {
                device->properties[property.name] = property.values;
            }
            return true;
        }
        case DirectoryOp::DELETE_DEVICE_PROPERTY: {
            if (args.empty()) {
                remote_error(errors, "DB_IncorrectArguments", "device name missing", origin);
                return false;
            }
            SimDevice *device = find_device(args[0], errors, origin);
            if (device == nullptr) {
                return false;
            }
            for (size_t i = 1; i < args.size(); ++i) {
                device->properties.erase(args[i]);
            }
            return true;
        }
        default:
            remote_error(errors, "API_CommandNotFound", "unsupported directory command", "SimSystem");
            return false;
    }
}

bool SimSystem::has_device(const std::string &device) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.count(device) > 0;
}

bool SimSystem::read_attribute(const std::string &device, const std::string &attr, remote::AttributeReading &reading,
                               ErrorStack &errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const SimDevice *dev = find_device(device, errors, "SimDeviceHandle::read_attribute");
    if (dev == nullptr) {
        return false;
    }
    auto it = dev->attributes.find(attr);
    if (it == dev->attributes.end()) {
        remote_error(errors, "API_AttrNotFound", attr + " attribute not found", "SimDeviceHandle::read_attribute");
        return false;
    }
    fill_reading(attr, it->second, reading);
    return true;
}

bool SimSystem::write_attribute(const std::string &device, const std::string &attr, const RemoteValue &value,
                                ErrorStack &errors) {
    std::lock_guard<std::mutex> lock(mutex_);
    SimDevice *dev = find_device(device, errors, "SimDeviceHandle::write_attribute");
    if (dev == nullptr) {
        return false;
    }
    auto it = dev->attributes.find(attr);
    if (it == dev->attributes.end()) {
        remote_error(errors, "API_AttrNotFound", attr + " attribute not found", "SimDeviceHandle::write_attribute");
        return false;
    }
    return commit_write(attr, it->second, value, errors, "SimDeviceHandle::write_attribute");
}

bool SimSystem::write_read_attribute(const std::string &device, const std::string &attr, const RemoteValue &value,
                                     remote::AttributeReading &reading, ErrorStack &errors) {
    std::lock_guard<std::mutex> lock(mutex_);
    SimDevice *dev = find_device(device, errors, "SimDeviceHandle::write_read_attribute");
    if (dev == nullptr) {
        return false;
    }
    auto it = dev->attributes.find(attr);
    if (it == dev->attributes.end()) {
        remote_error(errors, "API_AttrNotFound", attr + " attribute not found",
                     "SimDeviceHandle::write_read_attribute");
        return false;
    }
    if (!commit_write(attr, it->second, value, errors, "SimDeviceHandle::write_read_attribute")) {
        return false;
    }
    fill_reading(attr, it->second, reading);
    return true;
}

bool SimSystem::attribute_list(const std::string &device, remote::StringList &attrs, ErrorStack &errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const SimDevice *dev = find_device(device, errors, "SimDeviceHandle::get_attribute_list");
    if (dev == nullptr) {
        return false;
    }
    attrs = dev->attribute_order;
    return true;
}

bool SimSystem::attribute_config(const std::string &device, const std::string &attr,
                                 remote::AttributeDescriptor &descriptor, ErrorStack &errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const SimDevice *dev = find_device(device, errors, "SimDeviceHandle::get_attribute_config");
    if (dev == nullptr) {
        return false;
    }
    auto it = dev->attributes.find(attr);
    if (it == dev->attributes.end()) {
        remote_error(errors, "API_AttrNotFound", attr + " attribute not found",
                     "SimDeviceHandle::get_attribute_config");
        return false;
    }
    descriptor = it->second.descriptor;
    return true;
}

bool SimSystem::set_attribute_config(const std::string &device, const remote::AttributeDescriptor &descriptor,
                                     ErrorStack &errors) {
    std::lock_guard<std::mutex> lock(mutex_);
    SimDevice *dev = find_device(device, errors, "SimDeviceHandle::set_attribute_config");
    if (dev == nullptr) {
        return false;
    }
    auto it = dev->attributes.find(descriptor.name);
    if (it == dev->attributes.end()) {
        remote_error(errors, "API_AttrNotFound", descriptor.name + " attribute not found",
                     "SimDeviceHandle::set_attribute_config");
        return false;
    }
    auto &current = it->second.descriptor;
    if (descriptor.data_type != current.data_type || descriptor.data_format != current.data_format ||
        descriptor.writable != current.writable) {
        remote_error(errors, "API_AttrNotAllowed", "Type, format and writability of " + descriptor.name +
                                                       " cannot be changed",
                     "SimDeviceHandle::set_attribute_config");
        return false;
    }
    current = descriptor;
    return true;
}

bool SimSystem::commands(const std::string &device, std::vector<remote::CommandInfo> &commands,
                         ErrorStack &errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const SimDevice *dev = find_device(device, errors, "SimDeviceHandle::command_list_query");
    if (dev == nullptr) {
        return false;
    }
    commands = dev->commands;
    return true;
}

bool SimSystem::property_names(const std::string &device, const std::string &wildcard, remote::StringList &names,
                               ErrorStack &errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const SimDevice *dev = find_device(device, errors, "SimDeviceHandle::get_property_list");
    if (dev == nullptr) {
        return false;
    }
    names.clear();
    for (const auto &[name, values] : dev->properties) {
        if (wildcard_match(wildcard, name)) {
            names.push_back(name);
        }
    }
    return true;
}

bool SimSystem::device_info(const std::string &device, remote::DeviceInfo &info, ErrorStack &errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const SimDevice *dev = find_device(device, errors, "SimDeviceHandle::info");
    if (dev == nullptr) {
        return false;
    }
    info.dev_class = dev->class_name;
    info.server_id = dev->server;
    info.server_host = dev->host;
    info.doc_url = "Doc URL = http://www.tango-controls.org";
    return true;
}

bool SimSystem::import_info(const std::string &device, remote::ImportInfo &info, ErrorStack &errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const SimDevice *dev = find_device(device, errors, "SimDeviceHandle::import_info");
    if (dev == nullptr) {
        return false;
    }
    info.name = dev->name;
    info.exported = dev->exported;
    info.ior = "IOR:sim:" + dev->name;
    info.version = "5";
    return true;
}

size_t SimSystem::device_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

}  // namespace sim
}  // namespace tangorest
