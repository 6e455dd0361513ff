#ifndef TANGOREST_CODEC_PROPERTY_CODEC_HPP
#define TANGOREST_CODEC_PROPERTY_CODEC_HPP

#include <map>
#include <string>
#include <vector>

#include "errors/error_record.hpp"
#include "remote/remote_types.hpp"

namespace tangorest {
namespace codec {

/**
 * @brief Named, multi-valued directory property
 *
 * Value order is significant. An empty value list is valid.
 */
struct PropertyRecord {
    std::string name;
    std::vector<std::string> values;

    bool operator==(const PropertyRecord &other) const { return name == other.name && values == other.values; }
};

using PropertyList = std::vector<PropertyRecord>;
using PropertyMap = std::map<std::string, std::vector<std::string>>;

/**
 * Flat wire layout exchanged with the directory:
 *
 *   [device, count, name_1, n_1, v_1_1 .. v_1_n1, name_2, n_2, ...]
 *
 * Counts are decimal strings. Properties are written in the given order.
 */
remote::StringList encode_device_properties(const std::string &device, const PropertyList &properties);
remote::StringList encode_device_properties(const std::string &device, const PropertyMap &properties);

/**
 * @brief Decode a directory reply that still carries the device name at [0]
 *
 * An empty reply decodes to an empty list.
 *
 * @return false with a MalformedWireDataError record when a count is not a
 *         number or the array is shorter than its counts declare
 */
bool decode_device_properties(const remote::StringList &data, PropertyList &properties,
                              errors::ErrorStack &errors);

/**
 * @brief Decode starting at the property count field (device name stripped)
 */
bool decode_property_tail(const remote::StringList &data, PropertyList &properties, errors::ErrorStack &errors);

PropertyMap to_property_map(const PropertyList &properties);

}  // namespace codec
}  // namespace tangorest

#endif  // TANGOREST_CODEC_PROPERTY_CODEC_HPP
