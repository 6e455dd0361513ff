#ifndef TANGOREST_BRIDGE_VALUE_COERCION_HPP
#define TANGOREST_BRIDGE_VALUE_COERCION_HPP

#include <nlohmann/json.hpp>
#include <string>

#include "remote/remote_types.hpp"

namespace tangorest {
namespace bridge {

/**
 * @brief Convert a request string into the attribute's declared remote type
 *
 * Conversion policy:
 * - DevBoolean: true/false/1/0, case-insensitive
 * - Integer types: base-10, must fit the declared width (DevULong64 is
 *   limited to the int64 range)
 * - DevFloat/DevDouble: full decimal parse
 * - DevString: passed through
 * - DevState: state name or numeric code
 * - DevEnum: label from the descriptor, or its index
 * - SPECTRUM: comma separated elements, optionally wrapped in [ ]
 * - IMAGE: not supported
 *
 * @param error Set to a human readable reason on failure
 * @return true on success
 */
bool coerce_value(const std::string &text, const remote::AttributeDescriptor &descriptor, remote::RemoteValue &value,
                  std::string &error);

/**
 * @brief Normalize a value read back from the remote for the caller
 *
 * State values become their symbolic name, DevEnum indices become their
 * label. Everything else passes through unchanged.
 */
remote::RemoteValue render_value(const remote::RemoteValue &value, const remote::AttributeDescriptor &descriptor);

// Same as render_value, for readers without a descriptor at hand (state only)
remote::RemoteValue render_value(const remote::RemoteValue &value);

nlohmann::json value_to_json(const remote::RemoteValue &value);

// Short type name of the held alternative, for logs and errors
const char *value_type_name(const remote::RemoteValue &value);

}  // namespace bridge
}  // namespace tangorest

#endif  // TANGOREST_BRIDGE_VALUE_COERCION_HPP
