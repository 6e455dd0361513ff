#ifndef TANGOREST_BRIDGE_ATTRIBUTE_BRIDGE_HPP
#define TANGOREST_BRIDGE_ATTRIBUTE_BRIDGE_HPP

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors/error_record.hpp"
#include "remote/i_device_handle.hpp"
#include "remote/remote_types.hpp"

namespace tangorest {
namespace bridge {

// Attribute value as returned to callers (state/enum already rendered)
struct AttributeResult {
    std::string name;
    remote::RemoteValue value;
    std::optional<remote::RemoteValue> w_value;
    remote::AttrQuality quality = remote::AttrQuality::VALID;
    std::chrono::system_clock::time_point timestamp;
    bool has_failed = false;
};

// Ordered name -> string pairs, as supplied by the request layer
using StringPairs = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Write/read-back protocol for remote attributes
 *
 * A write always reports the value the remote committed, never the value
 * requested: the remote may clamp, round or reject. READ_WRITE and
 * READ_WITH_WRITE attributes use the combined write_read call (one round
 * trip); other attributes get a write followed by a separate read, in that
 * order, with nothing in between.
 *
 * Any failure (descriptor fetch, coercion, write, read back) fails the whole
 * operation; a partially completed write is never reported as a value.
 */
class AttributeBridge {
public:
    bool write_attribute(remote::IDeviceHandle &handle, const std::string &attr, const std::string &text,
                         AttributeResult &result, errors::ErrorStack &errors) const;

    // One descriptor fetch for all names, then per-attribute writes in request order
    bool write_attributes(remote::IDeviceHandle &handle, const StringPairs &values,
                          std::vector<AttributeResult> &results, errors::ErrorStack &errors) const;

    // Write with a descriptor the caller already holds
    bool write_with_descriptor(remote::IDeviceHandle &handle, const remote::AttributeDescriptor &descriptor,
                               const std::string &text, AttributeResult &result, errors::ErrorStack &errors) const;

    bool read_attribute(remote::IDeviceHandle &handle, const std::string &attr, AttributeResult &result,
                        errors::ErrorStack &errors) const;

    bool read_attributes(remote::IDeviceHandle &handle, const remote::StringList &attrs,
                         std::vector<AttributeResult> &results, errors::ErrorStack &errors) const;

    bool get_descriptor(remote::IDeviceHandle &handle, const std::string &attr, remote::AttributeDescriptor &descriptor,
                        errors::ErrorStack &errors) const;

    /**
     * @brief Apply configuration changes and push the descriptor back
     *
     * Integer params: max_dim_x, max_dim_y. Text params: label, description,
     * unit, standard_unit, display_unit, format, min_value, max_value,
     * min_alarm, max_alarm. Anything else is rejected before the remote is
     * touched.
     */
    bool update_attribute_config(remote::IDeviceHandle &handle, const std::string &attr, const StringPairs &params,
                                 remote::AttributeDescriptor &updated, errors::ErrorStack &errors) const;

    static bool uses_combined_write_read(remote::WriteType writable) {
        return writable == remote::WriteType::READ_WRITE || writable == remote::WriteType::READ_WITH_WRITE;
    }
};

}  // namespace bridge
}  // namespace tangorest

#endif  // TANGOREST_BRIDGE_ATTRIBUTE_BRIDGE_HPP
