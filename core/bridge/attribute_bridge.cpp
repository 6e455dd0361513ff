#include "attribute_bridge.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <unordered_map>

#include "logging/logger.hpp"
#include "value_coercion.hpp"

namespace tangorest {
namespace bridge {

using errors::ErrorKind;
using errors::ErrorStack;

namespace {

AttributeResult make_result(const remote::AttributeReading &reading, const remote::AttributeDescriptor *descriptor) {
    AttributeResult result;
    result.name = reading.name;
    result.value = descriptor != nullptr ? render_value(reading.value, *descriptor) : render_value(reading.value);
    if (reading.w_value.has_value()) {
        result.w_value = descriptor != nullptr ? render_value(*reading.w_value, *descriptor)
                                               : render_value(*reading.w_value);
    }
    result.quality = reading.quality;
    result.timestamp = reading.timestamp;
    result.has_failed = reading.has_failed;
    return result;
}

bool parse_dimension(const std::string &text, int &out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    const long parsed = std::strtol(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size() || errno == ERANGE || parsed < 0 || parsed > INT_MAX) {
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

}  // namespace

bool AttributeBridge::get_descriptor(remote::IDeviceHandle &handle, const std::string &attr,
                                     remote::AttributeDescriptor &descriptor, ErrorStack &errors) const {
    std::vector<remote::AttributeDescriptor> descriptors;
    if (!handle.get_attribute_config({attr}, descriptors, errors)) {
        errors::ensure_cause(errors, ErrorKind::REMOTE_CALL, "Cannot get configuration of attribute " + attr,
                             "AttributeBridge::get_descriptor");
        return false;
    }
    if (descriptors.empty()) {
        errors.push_back(errors::make_error(ErrorKind::REMOTE_CALL, "No configuration returned for attribute " + attr,
                                            "AttributeBridge::get_descriptor"));
        return false;
    }
    descriptor = descriptors.front();
    return true;
}

bool AttributeBridge::write_attribute(remote::IDeviceHandle &handle, const std::string &attr, const std::string &text,
                                      AttributeResult &result, ErrorStack &errors) const {
    remote::AttributeDescriptor descriptor;
    if (!get_descriptor(handle, attr, descriptor, errors)) {
        return false;
    }
    return write_with_descriptor(handle, descriptor, text, result, errors);
}

bool AttributeBridge::write_attributes(remote::IDeviceHandle &handle, const StringPairs &values,
                                       std::vector<AttributeResult> &results, ErrorStack &errors) const {
    remote::StringList names;
    names.reserve(values.size());
    for (const auto &[name, text] : values) {
        names.push_back(name);
    }

    std::vector<remote::AttributeDescriptor> descriptors;
    if (!handle.get_attribute_config(names, descriptors, errors)) {
        errors::ensure_cause(errors, ErrorKind::REMOTE_CALL, "Cannot get attribute configuration",
                             "AttributeBridge::write_attributes");
        return false;
    }

    std::unordered_map<std::string, const remote::AttributeDescriptor *> by_name;
    for (const auto &descriptor : descriptors) {
        by_name[descriptor.name] = &descriptor;
    }

    std::vector<AttributeResult> written;
    written.reserve(values.size());
    for (const auto &[name, text] : values) {
        auto it = by_name.find(name);
        if (it == by_name.end()) {
            errors.push_back(errors::make_error(ErrorKind::REMOTE_CALL, "No configuration returned for attribute " + name,
                                                "AttributeBridge::write_attributes"));
            return false;
        }
        AttributeResult result;
        if (!write_with_descriptor(handle, *it->second, text, result, errors)) {
            return false;
        }
        written.push_back(std::move(result));
    }

    results = std::move(written);
    return true;
}

bool AttributeBridge::write_with_descriptor(remote::IDeviceHandle &handle, const remote::AttributeDescriptor &descriptor,
                                            const std::string &text, AttributeResult &result,
                                            ErrorStack &errors) const {
    const std::string &attr = descriptor.name;

    remote::RemoteValue value;
    std::string coercion_error;
    if (!coerce_value(text, descriptor, value, coercion_error)) {
        errors.push_back(errors::make_error(ErrorKind::VALUE_COERCION,
                                            "Cannot convert '" + text + "' for attribute " + attr + " (" +
                                                remote::data_type_to_string(descriptor.data_type) +
                                                "): " + coercion_error,
                                            "AttributeBridge::write_attribute"));
        LOG_WARN("[AttributeBridge] " << errors.back().description);
        return false;
    }

    remote::AttributeReading reading;
    if (uses_combined_write_read(descriptor.writable)) {
        if (!handle.write_read_attribute(attr, value, reading, errors)) {
            errors::ensure_cause(errors, ErrorKind::REMOTE_CALL, "write_read of attribute " + attr + " failed",
                                 "AttributeBridge::write_attribute");
            return false;
        }
    } else {
        if (!handle.write_attribute(attr, value, errors)) {
            errors::ensure_cause(errors, ErrorKind::REMOTE_CALL, "Write of attribute " + attr + " failed",
                                 "AttributeBridge::write_attribute");
            return false;
        }
        if (!handle.read_attribute(attr, reading, errors)) {
            errors::ensure_cause(errors, ErrorKind::REMOTE_CALL, "Read back of attribute " + attr + " failed",
                                 "AttributeBridge::write_attribute");
            return false;
        }
    }

    if (reading.has_failed) {
        errors.push_back(errors::make_error(ErrorKind::REMOTE_CALL,
                                            "Read back of attribute " + attr + " returned no committed value",
                                            "AttributeBridge::write_attribute"));
        return false;
    }

    result = make_result(reading, &descriptor);
    if (result.name.empty()) {
        result.name = attr;
    }
    LOG_DEBUG("[AttributeBridge] " << handle.name() << "/" << attr << " <- '" << text << "' (committed "
                                   << value_type_name(result.value) << ")");
    return true;
}

bool AttributeBridge::read_attribute(remote::IDeviceHandle &handle, const std::string &attr, AttributeResult &result,
                                     ErrorStack &errors) const {
    remote::AttributeReading reading;
    if (!handle.read_attribute(attr, reading, errors)) {
        errors::ensure_cause(errors, ErrorKind::REMOTE_CALL, "Read of attribute " + attr + " failed",
                             "AttributeBridge::read_attribute");
        return false;
    }
    result = make_result(reading, nullptr);
    if (result.name.empty()) {
        result.name = attr;
    }
    return true;
}

bool AttributeBridge::read_attributes(remote::IDeviceHandle &handle, const remote::StringList &attrs,
                                      std::vector<AttributeResult> &results, ErrorStack &errors) const {
    std::vector<remote::AttributeReading> readings;
    if (!handle.read_attributes(attrs, readings, errors)) {
        errors::ensure_cause(errors, ErrorKind::REMOTE_CALL, "Read of attributes failed",
                             "AttributeBridge::read_attributes");
        return false;
    }
    results.clear();
    results.reserve(readings.size());
    for (const auto &reading : readings) {
        results.push_back(make_result(reading, nullptr));
    }
    return true;
}

bool AttributeBridge::update_attribute_config(remote::IDeviceHandle &handle, const std::string &attr,
                                              const StringPairs &params, remote::AttributeDescriptor &updated,
                                              ErrorStack &errors) const {
    remote::AttributeDescriptor descriptor;
    if (!get_descriptor(handle, attr, descriptor, errors)) {
        return false;
    }

    const std::unordered_map<std::string, std::string remote::AttributeDescriptor::*> text_fields = {
        {"label", &remote::AttributeDescriptor::label},
        {"description", &remote::AttributeDescriptor::description},
        {"unit", &remote::AttributeDescriptor::unit},
        {"standard_unit", &remote::AttributeDescriptor::standard_unit},
        {"display_unit", &remote::AttributeDescriptor::display_unit},
        {"format", &remote::AttributeDescriptor::format},
        {"min_value", &remote::AttributeDescriptor::min_value},
        {"max_value", &remote::AttributeDescriptor::max_value},
        {"min_alarm", &remote::AttributeDescriptor::min_alarm},
        {"max_alarm", &remote::AttributeDescriptor::max_alarm},
    };

    for (const auto &[param, value] : params) {
        if (param == "max_dim_x" || param == "max_dim_y") {
            int dim = 0;
            if (!parse_dimension(value, dim)) {
                errors.push_back(errors::make_error(ErrorKind::VALUE_COERCION,
                                                    "Cannot convert '" + value + "' for " + param + " of attribute " +
                                                        attr + ": expected a non-negative integer",
                                                    "AttributeBridge::update_attribute_config"));
                return false;
            }
            (param == "max_dim_x" ? descriptor.max_dim_x : descriptor.max_dim_y) = dim;
            continue;
        }

        auto field = text_fields.find(param);
        if (field == text_fields.end()) {
            errors.push_back(errors::make_error(ErrorKind::VALUE_COERCION,
                                                "Unknown configuration parameter '" + param + "' for attribute " + attr,
                                                "AttributeBridge::update_attribute_config"));
            return false;
        }
        descriptor.*(field->second) = value;
    }

    if (!handle.set_attribute_config(descriptor, errors)) {
        errors::ensure_cause(errors, ErrorKind::REMOTE_CALL, "Cannot set configuration of attribute " + attr,
                             "AttributeBridge::update_attribute_config");
        return false;
    }

    LOG_INFO("[AttributeBridge] Updated configuration of " << handle.name() << "/" << attr << " (" << params.size()
                                                           << " parameters)");
    updated = descriptor;
    return true;
}

}  // namespace bridge
}  // namespace tangorest
