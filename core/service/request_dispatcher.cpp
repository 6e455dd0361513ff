#include "request_dispatcher.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace tangorest {
namespace service {

namespace {

const std::vector<OperationSpec> kOperations = {
    {Operation::LIST_DEVICES, "list_devices", false, "[wildcard=PATTERN]"},
    {Operation::GET_DEVICE, "get_device", true, ""},
    {Operation::GET_STATE, "get_state", true, ""},
    {Operation::LIST_ATTRIBUTES, "list_attributes", true, ""},
    {Operation::READ_ATTRIBUTES, "read_attributes", true, "ATTR= [ATTR= ...]"},
    {Operation::READ_ATTRIBUTE, "read_attribute", true, "attribute=NAME"},
    {Operation::WRITE_ATTRIBUTE, "write_attribute", true, "attribute=NAME value=VALUE"},
    {Operation::WRITE_ATTRIBUTES, "write_attributes", true, "ATTR=VALUE [ATTR=VALUE ...]"},
    {Operation::GET_ATTRIBUTE_INFO, "get_attribute_info", true, "attribute=NAME"},
    {Operation::UPDATE_ATTRIBUTE_INFO, "update_attribute_info", true, "attribute=NAME PARAM=VALUE ..."},
    {Operation::GET_PROPERTIES, "get_properties", true, "[wildcard=PATTERN]"},
    {Operation::PUT_PROPERTIES, "put_properties", true, "PROP=VALUE [PROP=VALUE ...]"},
    {Operation::GET_PROPERTY, "get_property", true, "property=NAME"},
    {Operation::PUT_PROPERTY, "put_property", true, "property=NAME value=V [value=V ...]"},
    {Operation::DELETE_PROPERTY, "delete_property", true, "property=NAME"},
    {Operation::LIST_COMMANDS, "list_commands", true, ""},
};

ServiceResult invalid_request(const std::string &description) {
    return ServiceResult::failure(
        {errors::make_error(errors::ErrorKind::INVALID_REQUEST, description, "RequestDispatcher::dispatch")});
}

std::optional<std::string> first_arg(const Request &request, const std::string &key) {
    for (const auto &[k, v] : request.args) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

std::vector<std::string> all_args(const Request &request, const std::string &key) {
    std::vector<std::string> values;
    for (const auto &[k, v] : request.args) {
        if (k == key) {
            values.push_back(v);
        }
    }
    return values;
}

// Argument pairs minus the named key
bridge::StringPairs args_except(const Request &request, const std::string &key) {
    bridge::StringPairs pairs;
    for (const auto &[k, v] : request.args) {
        if (k != key) {
            pairs.emplace_back(k, v);
        }
    }
    return pairs;
}

}  // namespace

const std::vector<OperationSpec> &all_operations() { return kOperations; }

std::optional<Operation> operation_from_string(const std::string &name) {
    for (const auto &spec : kOperations) {
        if (name == spec.name) {
            return spec.op;
        }
    }
    return std::nullopt;
}

RequestDispatcher::RequestDispatcher(DeviceService &service) : service_(service) {}

ServiceResult RequestDispatcher::dispatch(const Request &request) {
    auto op = operation_from_string(request.operation);
    if (!op) {
        LOG_WARN("[Dispatcher] Unknown operation: " << request.operation);
        return invalid_request("Unknown operation '" + request.operation + "'");
    }

    const auto &spec = kOperations.at(static_cast<size_t>(*op));
    LOG_DEBUG("[Dispatcher] " << spec.name << " " << request.device << " (" << request.args.size() << " args)");

    if (!spec.needs_device) {
        return service_.list_devices(first_arg(request, "wildcard").value_or("*"));
    }

    std::string parse_error;
    auto id = remote::EntityId::parse(request.device, &parse_error);
    if (!id) {
        return invalid_request(parse_error);
    }
    return dispatch_device_op(*op, *id, request);
}

ServiceResult RequestDispatcher::dispatch_device_op(Operation op, const remote::EntityId &id, const Request &request) {
    auto require = [&request](const std::string &key, std::string &out) {
        auto value = first_arg(request, key);
        if (!value || value->empty()) {
            return false;
        }
        out = *value;
        return true;
    };

    std::string attribute;
    std::string property;
    std::string value;

    switch (op) {
        case Operation::GET_DEVICE:
            return service_.get_device(id);
        case Operation::GET_STATE:
            return service_.get_device_state(id);
        case Operation::LIST_ATTRIBUTES:
            return service_.list_attributes(id);
        case Operation::READ_ATTRIBUTES: {
            if (request.args.empty()) {
                return service_.list_attributes(id);
            }
            remote::StringList names;
            for (const auto &[k, v] : request.args) {
                names.push_back(k);
            }
            return service_.read_attributes(id, names);
        }
        case Operation::READ_ATTRIBUTE:
            if (!require("attribute", attribute)) return invalid_request("Missing argument 'attribute'");
            return service_.read_attribute(id, attribute);
        case Operation::WRITE_ATTRIBUTE:
            if (!require("attribute", attribute)) return invalid_request("Missing argument 'attribute'");
            if (!require("value", value)) return invalid_request("Missing argument 'value'");
            return service_.write_attribute(id, attribute, value);
        case Operation::WRITE_ATTRIBUTES:
            if (request.args.empty()) return invalid_request("No attribute values given");
            return service_.write_attributes(id, request.args);
        case Operation::GET_ATTRIBUTE_INFO:
            if (!require("attribute", attribute)) return invalid_request("Missing argument 'attribute'");
            return service_.get_attribute_info(id, attribute);
        case Operation::UPDATE_ATTRIBUTE_INFO:
            if (!require("attribute", attribute)) return invalid_request("Missing argument 'attribute'");
            return service_.update_attribute_info(id, attribute, args_except(request, "attribute"));
        case Operation::GET_PROPERTIES:
            return service_.get_device_properties(id, first_arg(request, "wildcard").value_or("*"));
        case Operation::PUT_PROPERTIES: {
            if (request.args.empty()) return invalid_request("No property values given");
            // Group repeated keys, first occurrence fixes the order
            codec::PropertyList properties;
            for (const auto &[k, v] : request.args) {
                auto it = std::find_if(properties.begin(), properties.end(),
                                       [&k](const codec::PropertyRecord &p) { return p.name == k; });
                if (it == properties.end()) {
                    properties.push_back(codec::PropertyRecord{k, {v}});
                } else {
                    it->values.push_back(v);
                }
            }
            return service_.put_device_properties(id, properties);
        }
        case Operation::GET_PROPERTY:
            if (!require("property", property)) return invalid_request("Missing argument 'property'");
            return service_.get_device_property(id, property);
        case Operation::PUT_PROPERTY:
            if (!require("property", property)) return invalid_request("Missing argument 'property'");
            return service_.put_device_property(id, property, all_args(request, "value"));
        case Operation::DELETE_PROPERTY:
            if (!require("property", property)) return invalid_request("Missing argument 'property'");
            return service_.delete_device_property(id, property);
        case Operation::LIST_COMMANDS:
            return service_.list_commands(id);
        case Operation::LIST_DEVICES:
        default:
            return invalid_request("Operation does not take a device");
    }
}

}  // namespace service
}  // namespace tangorest
