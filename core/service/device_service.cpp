#include "device_service.hpp"

#include "bridge/value_coercion.hpp"
#include "json_encoding.hpp"
#include "logging/logger.hpp"

namespace tangorest {
namespace service {

using errors::ErrorStack;
using remote::EntityId;

ServiceResult ServiceResult::ok(nlohmann::json data) {
    ServiceResult result;
    result.success = true;
    result.data = std::move(data);
    return result;
}

ServiceResult ServiceResult::failure(const ErrorStack &errors) {
    ServiceResult result;
    result.success = false;
    result.error = errors::normalize_errors(errors);
    return result;
}

nlohmann::json ServiceResult::to_json() const { return success ? data : errors::to_json(error); }

DeviceService::DeviceService(ServiceContext &context) : context_(context) {}

ServiceResult DeviceService::list_devices(const std::string &wildcard) {
    ErrorStack errors;
    remote::StringList devices;
    if (!context_.directory().get_device_wide_list(wildcard, devices, errors)) {
        return ServiceResult::failure(errors);
    }

    nlohmann::json data = nlohmann::json::array();
    for (const auto &name : devices) {
        data.push_back({{"name", name}});
    }
    return ServiceResult::ok(std::move(data));
}

ServiceResult DeviceService::get_device(const EntityId &id) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    // Independent lookups, issued one after the other
    std::vector<bridge::AttributeResult> state_status;
    if (!context_.bridge().read_attributes(*handle, {"State", "Status"}, state_status, errors)) {
        return ServiceResult::failure(errors);
    }
    if (state_status.size() != 2) {
        errors.push_back(errors::make_error(errors::ErrorKind::REMOTE_CALL,
                                            "Expected State and Status from " + id.str(), "DeviceService::get_device"));
        return ServiceResult::failure(errors);
    }

    remote::DeviceInfo dev_info;
    if (!handle->info(dev_info, errors)) {
        errors::ensure_cause(errors, errors::ErrorKind::REMOTE_CALL, "info() failed for " + id.str(),
                             "DeviceService::get_device");
        return ServiceResult::failure(errors);
    }

    directory::DeviceDirectoryInfo db_info;
    if (!context_.directory().get_device_info(id.str(), db_info, errors)) {
        return ServiceResult::failure(errors);
    }

    remote::ImportInfo import_info;
    if (!handle->import_info(import_info, errors)) {
        errors::ensure_cause(errors, errors::ErrorKind::REMOTE_CALL, "import_info() failed for " + id.str(),
                             "DeviceService::get_device");
        return ServiceResult::failure(errors);
    }

    remote::StringList attributes;
    if (!handle->get_attribute_list(attributes, errors)) {
        errors::ensure_cause(errors, errors::ErrorKind::REMOTE_CALL, "Attribute list failed for " + id.str(),
                             "DeviceService::get_device");
        return ServiceResult::failure(errors);
    }

    std::vector<remote::CommandInfo> commands;
    if (!handle->command_list_query(commands, errors)) {
        errors::ensure_cause(errors, errors::ErrorKind::REMOTE_CALL, "Command list failed for " + id.str(),
                             "DeviceService::get_device");
        return ServiceResult::failure(errors);
    }
    nlohmann::json command_names = nlohmann::json::array();
    for (const auto &command : commands) {
        command_names.push_back(command.cmd_name);
    }

    remote::StringList properties;
    if (!handle->get_property_list("*", properties, errors)) {
        errors::ensure_cause(errors, errors::ErrorKind::REMOTE_CALL, "Property list failed for " + id.str(),
                             "DeviceService::get_device");
        return ServiceResult::failure(errors);
    }

    return ServiceResult::ok({{"name", id.str()},
                              {"state", bridge::value_to_json(state_status[0].value)},
                              {"status", bridge::value_to_json(state_status[1].value)},
                              {"info", encode_device_info(db_info, dev_info, import_info)},
                              {"attributes", encode_string_list(attributes)},
                              {"commands", command_names},
                              {"properties", encode_string_list(properties)}});
}

ServiceResult DeviceService::get_device_state(const EntityId &id) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    std::vector<bridge::AttributeResult> state_status;
    if (!context_.bridge().read_attributes(*handle, {"State", "Status"}, state_status, errors)) {
        return ServiceResult::failure(errors);
    }
    if (state_status.size() != 2) {
        errors.push_back(errors::make_error(errors::ErrorKind::REMOTE_CALL,
                                            "Expected State and Status from " + id.str(),
                                            "DeviceService::get_device_state"));
        return ServiceResult::failure(errors);
    }

    return ServiceResult::ok({{"state", bridge::value_to_json(state_status[0].value)},
                              {"status", bridge::value_to_json(state_status[1].value)}});
}

ServiceResult DeviceService::list_attributes(const EntityId &id) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    remote::StringList attributes;
    if (!handle->get_attribute_list(attributes, errors)) {
        errors::ensure_cause(errors, errors::ErrorKind::REMOTE_CALL, "Attribute list failed for " + id.str(),
                             "DeviceService::list_attributes");
        return ServiceResult::failure(errors);
    }
    return ServiceResult::ok(encode_string_list(attributes));
}

ServiceResult DeviceService::read_attributes(const EntityId &id, const remote::StringList &attrs) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    std::vector<bridge::AttributeResult> results;
    if (!context_.bridge().read_attributes(*handle, attrs, results, errors)) {
        return ServiceResult::failure(errors);
    }

    nlohmann::json data = nlohmann::json::object();
    for (const auto &result : results) {
        data[result.name] = encode_attribute_reading(result);
    }
    return ServiceResult::ok(std::move(data));
}

ServiceResult DeviceService::read_attribute(const EntityId &id, const std::string &attr) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    bridge::AttributeResult result;
    if (!context_.bridge().read_attribute(*handle, attr, result, errors)) {
        return ServiceResult::failure(errors);
    }
    return ServiceResult::ok(encode_attribute_result(result));
}

ServiceResult DeviceService::write_attribute(const EntityId &id, const std::string &attr, const std::string &value) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    bridge::AttributeResult result;
    if (!context_.bridge().write_attribute(*handle, attr, value, result, errors)) {
        return ServiceResult::failure(errors);
    }
    return ServiceResult::ok(encode_attribute_result(result));
}

ServiceResult DeviceService::write_attributes(const EntityId &id, const bridge::StringPairs &values) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    std::vector<bridge::AttributeResult> results;
    if (!context_.bridge().write_attributes(*handle, values, results, errors)) {
        return ServiceResult::failure(errors);
    }

    nlohmann::json data = nlohmann::json::array();
    for (const auto &result : results) {
        data.push_back(encode_attribute_result(result));
    }
    return ServiceResult::ok(std::move(data));
}

ServiceResult DeviceService::get_attribute_info(const EntityId &id, const std::string &attr) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    remote::AttributeDescriptor descriptor;
    if (!context_.bridge().get_descriptor(*handle, attr, descriptor, errors)) {
        return ServiceResult::failure(errors);
    }
    return ServiceResult::ok(encode_attribute_descriptor(descriptor));
}

ServiceResult DeviceService::update_attribute_info(const EntityId &id, const std::string &attr,
                                                   const bridge::StringPairs &params) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    remote::AttributeDescriptor updated;
    if (!context_.bridge().update_attribute_config(*handle, attr, params, updated, errors)) {
        return ServiceResult::failure(errors);
    }
    return ServiceResult::ok(encode_attribute_descriptor(updated));
}

ServiceResult DeviceService::get_device_properties(const EntityId &id, const std::string &wildcard) {
    ErrorStack errors;
    remote::StringList names;
    if (!context_.directory().get_device_property_list(id.str(), wildcard, names, errors)) {
        return ServiceResult::failure(errors);
    }
    if (names.empty()) {
        return ServiceResult::ok(nlohmann::json::array());
    }

    remote::StringList flat;
    if (!context_.directory().get_device_property(id.str(), names, flat, errors)) {
        return ServiceResult::failure(errors);
    }

    codec::PropertyList properties;
    if (!codec::decode_device_properties(flat, properties, errors)) {
        return ServiceResult::failure(errors);
    }
    return ServiceResult::ok(encode_properties(properties));
}

ServiceResult DeviceService::put_device_properties(const EntityId &id, const codec::PropertyList &properties) {
    ErrorStack errors;
    if (!context_.directory().put_device_property(codec::encode_device_properties(id.str(), properties), errors)) {
        return ServiceResult::failure(errors);
    }
    LOG_INFO("[DeviceService] Stored " << properties.size() << " properties for " << id.str());

    remote::StringList names;
    names.reserve(properties.size());
    for (const auto &property : properties) {
        names.push_back(property.name);
    }
    return read_back_properties(id, names);
}

ServiceResult DeviceService::get_device_property(const EntityId &id, const std::string &property) {
    ErrorStack errors;
    remote::StringList flat;
    if (!context_.directory().get_device_property(id.str(), {property}, flat, errors)) {
        return ServiceResult::failure(errors);
    }

    codec::PropertyList properties;
    if (!codec::decode_device_properties(flat, properties, errors)) {
        return ServiceResult::failure(errors);
    }
    return ServiceResult::ok(encode_properties(properties));
}

ServiceResult DeviceService::put_device_property(const EntityId &id, const std::string &property,
                                                 const std::vector<std::string> &values) {
    return put_device_properties(id, {codec::PropertyRecord{property, values}});
}

ServiceResult DeviceService::delete_device_property(const EntityId &id, const std::string &property) {
    ErrorStack errors;
    if (!context_.directory().delete_device_property(id.str(), {property}, errors)) {
        return ServiceResult::failure(errors);
    }
    LOG_INFO("[DeviceService] Deleted property " << property << " of " << id.str());
    return ServiceResult::ok(nlohmann::json::array());
}

ServiceResult DeviceService::list_commands(const EntityId &id) {
    ErrorStack errors;
    std::shared_ptr<remote::IDeviceHandle> handle;
    if (!context_.pool().acquire(id, handle, errors)) {
        return ServiceResult::failure(errors);
    }

    std::vector<remote::CommandInfo> commands;
    if (!handle->command_list_query(commands, errors)) {
        errors::ensure_cause(errors, errors::ErrorKind::REMOTE_CALL, "Command list failed for " + id.str(),
                             "DeviceService::list_commands");
        return ServiceResult::failure(errors);
    }

    nlohmann::json data = nlohmann::json::array();
    for (const auto &command : commands) {
        data.push_back(encode_command(command));
    }
    return ServiceResult::ok(std::move(data));
}

ServiceResult DeviceService::read_back_properties(const EntityId &id, const remote::StringList &names) {
    ErrorStack errors;
    remote::StringList flat;
    if (!context_.directory().get_device_property(id.str(), names, flat, errors, directory::ReadMode::FRESH)) {
        return ServiceResult::failure(errors);
    }

    codec::PropertyList properties;
    if (!codec::decode_device_properties(flat, properties, errors)) {
        return ServiceResult::failure(errors);
    }
    return ServiceResult::ok(encode_properties(properties));
}

}  // namespace service
}  // namespace tangorest
