#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "bridge/attribute_bridge.hpp"
#include "codec/property_codec.hpp"
#include "directory/cached_directory.hpp"
#include "remote/remote_types.hpp"

namespace tangorest {
namespace service {

/**
 * @brief Structured-data encoders for operation results
 *
 * Timestamps are epoch seconds (double). Enumerations use the remote
 * system's own names ("ATTR_VALID", "READ_WRITE", "DevDouble").
 */

// {name, value, quality, timestamp}
nlohmann::json encode_attribute_result(const bridge::AttributeResult &result);

// {value, quality, timestamp[, w_value][, has_failed]} (name is the map key)
nlohmann::json encode_attribute_reading(const bridge::AttributeResult &result);

nlohmann::json encode_attribute_descriptor(const remote::AttributeDescriptor &descriptor);

nlohmann::json encode_command(const remote::CommandInfo &command);

// [{name, values}]
nlohmann::json encode_properties(const codec::PropertyList &properties);

nlohmann::json encode_device_info(const directory::DeviceDirectoryInfo &db_info, const remote::DeviceInfo &dev_info,
                                  const remote::ImportInfo &import_info);

nlohmann::json encode_string_list(const remote::StringList &strings);

}  // namespace service
}  // namespace tangorest
