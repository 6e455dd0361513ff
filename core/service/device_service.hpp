#ifndef TANGOREST_SERVICE_DEVICE_SERVICE_HPP
#define TANGOREST_SERVICE_DEVICE_SERVICE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "bridge/attribute_bridge.hpp"
#include "codec/property_codec.hpp"
#include "errors/error_envelope.hpp"
#include "remote/entity_id.hpp"
#include "service_context.hpp"

namespace tangorest {
namespace service {

// Operation outcome: structured data on success, the uniform envelope otherwise
struct ServiceResult {
    bool success = false;
    nlohmann::json data;
    errors::ErrorEnvelope error;

    static ServiceResult ok(nlohmann::json data);
    static ServiceResult failure(const errors::ErrorStack &errors);

    // data on success, the envelope on failure
    nlohmann::json to_json() const;
};

/**
 * @brief Device, attribute, property and command operations
 *
 * Every operation resolves its target through the context (pooled handles,
 * cached directory) and runs its remote calls sequentially. Failures are
 * never retried; they surface as ServiceResult::failure with the full
 * ordered cause list.
 */
class DeviceService {
public:
    explicit DeviceService(ServiceContext &context);

    // Devices
    ServiceResult list_devices(const std::string &wildcard = "*");
    ServiceResult get_device(const remote::EntityId &id);
    ServiceResult get_device_state(const remote::EntityId &id);

    // Attributes
    ServiceResult list_attributes(const remote::EntityId &id);
    ServiceResult read_attributes(const remote::EntityId &id, const remote::StringList &attrs);
    ServiceResult read_attribute(const remote::EntityId &id, const std::string &attr);
    ServiceResult write_attribute(const remote::EntityId &id, const std::string &attr, const std::string &value);
    ServiceResult write_attributes(const remote::EntityId &id, const bridge::StringPairs &values);
    ServiceResult get_attribute_info(const remote::EntityId &id, const std::string &attr);
    ServiceResult update_attribute_info(const remote::EntityId &id, const std::string &attr,
                                        const bridge::StringPairs &params);

    // Properties (directory only, no device handle involved)
    ServiceResult get_device_properties(const remote::EntityId &id, const std::string &wildcard = "*");
    ServiceResult put_device_properties(const remote::EntityId &id, const codec::PropertyList &properties);
    ServiceResult get_device_property(const remote::EntityId &id, const std::string &property);
    ServiceResult put_device_property(const remote::EntityId &id, const std::string &property,
                                      const std::vector<std::string> &values);
    ServiceResult delete_device_property(const remote::EntityId &id, const std::string &property);

    // Commands
    ServiceResult list_commands(const remote::EntityId &id);

private:
    // Reads back properties straight from the directory after a mutation
    ServiceResult read_back_properties(const remote::EntityId &id, const remote::StringList &names);

    ServiceContext &context_;
};

}  // namespace service
}  // namespace tangorest

#endif  // TANGOREST_SERVICE_DEVICE_SERVICE_HPP
