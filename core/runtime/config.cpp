#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "../logging/logger.hpp"
#include "../remote/entity_id.hpp"
#include "../remote/remote_types.hpp"

namespace tangorest {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::vector<std::string> &valid_keys, const std::string &where) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("[Config] Unknown key: '" << where << key << "' (will be ignored)");
        }
    }
}

// Scalars and sequences both accepted for property values
std::vector<std::string> as_string_list(const YAML::Node &node) {
    std::vector<std::string> values;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            values.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
    }
    return values;
}

sim::SimAttributeConfig parse_attribute(const YAML::Node &node) {
    sim::SimAttributeConfig attribute;
    if (node["name"]) attribute.name = node["name"].as<std::string>();
    if (node["type"]) attribute.type = node["type"].as<std::string>();
    if (node["format"]) attribute.format = node["format"].as<std::string>();
    if (node["writable"]) attribute.writable = node["writable"].as<std::string>();
    if (node["value"]) attribute.value = node["value"].as<std::string>();
    if (node["min"]) attribute.min = node["min"].as<double>();
    if (node["max"]) attribute.max = node["max"].as<double>();
    if (node["unit"]) attribute.unit = node["unit"].as<std::string>();
    if (node["label"]) attribute.label = node["label"].as<std::string>();
    if (node["enum_labels"]) attribute.enum_labels = as_string_list(node["enum_labels"]);
    if (node["max_dim_x"]) attribute.max_dim_x = node["max_dim_x"].as<int>();
    return attribute;
}

sim::SimCommandConfig parse_command(const YAML::Node &node) {
    sim::SimCommandConfig command;
    if (node.IsScalar()) {
        command.name = node.as<std::string>();
        return command;
    }
    if (node["name"]) command.name = node["name"].as<std::string>();
    if (node["in_type"]) command.in_type = node["in_type"].as<std::string>();
    if (node["out_type"]) command.out_type = node["out_type"].as<std::string>();
    if (node["in_type_desc"]) command.in_type_desc = node["in_type_desc"].as<std::string>();
    if (node["out_type_desc"]) command.out_type_desc = node["out_type_desc"].as<std::string>();
    return command;
}

sim::SimDeviceConfig parse_device(const YAML::Node &node) {
    sim::SimDeviceConfig device;
    if (node["name"]) device.name = node["name"].as<std::string>();
    if (node["class"]) device.class_name = node["class"].as<std::string>();
    if (node["server"]) device.server = node["server"].as<std::string>();
    if (node["host"]) device.host = node["host"].as<std::string>();
    if (node["state"]) device.state = node["state"].as<std::string>();
    if (node["status"]) device.status = node["status"].as<std::string>();
    if (node["exported"]) device.exported = node["exported"].as<bool>();

    if (node["properties"]) {
        for (const auto &property : node["properties"]) {
            device.properties[property.first.as<std::string>()] = as_string_list(property.second);
        }
    }
    if (node["attributes"]) {
        for (const auto &attribute_node : node["attributes"]) {
            device.attributes.push_back(parse_attribute(attribute_node));
        }
    }
    if (node["commands"]) {
        for (const auto &command_node : node["commands"]) {
            device.commands.push_back(parse_command(command_node));
        }
    }
    return device;
}

bool validate_device(const sim::SimDeviceConfig &device, std::string &error) {
    std::string id_error;
    if (!remote::EntityId::parse(device.name, &id_error)) {
        error = "Simulated device '" + device.name + "': " + id_error;
        return false;
    }
    if (!remote::device_state_from_string(device.state)) {
        error = "Simulated device '" + device.name + "' has invalid state: " + device.state;
        return false;
    }

    std::set<std::string> names = {"State", "Status"};
    for (const auto &attribute : device.attributes) {
        if (attribute.name.empty()) {
            error = "Simulated device '" + device.name + "' has an attribute without name";
            return false;
        }
        if (!names.insert(attribute.name).second) {
            error = "Simulated device '" + device.name + "' declares attribute '" + attribute.name + "' twice";
            return false;
        }
        if (!remote::data_type_from_string(attribute.type)) {
            error = "Attribute '" + device.name + "/" + attribute.name + "' has invalid type: " + attribute.type;
            return false;
        }
        auto format = remote::data_format_from_string(attribute.format);
        if (!format || *format == remote::DataFormat::IMAGE) {
            error = "Attribute '" + device.name + "/" + attribute.name + "' has invalid format: " + attribute.format;
            return false;
        }
        if (!remote::write_type_from_string(attribute.writable)) {
            error = "Attribute '" + device.name + "/" + attribute.name + "' has invalid writable: " +
                    attribute.writable;
            return false;
        }
        if (attribute.min && attribute.max && *attribute.min > *attribute.max) {
            error = "Attribute '" + device.name + "/" + attribute.name + "' has min greater than max";
            return false;
        }
        if (attribute.max_dim_x < 1) {
            error = "Attribute '" + device.name + "/" + attribute.name + "' max_dim_x must be >= 1";
            return false;
        }
    }

    for (const auto &command : device.commands) {
        if (command.name.empty()) {
            error = "Simulated device '" + device.name + "' has a command without name";
            return false;
        }
    }
    return true;
}

}  // namespace

bool validate_config(const ServiceConfig &config, std::string &error) {
    std::string id_error;
    if (!remote::EntityId::parse(config.directory.device, &id_error)) {
        error = "Invalid directory.device: " + id_error;
        return false;
    }

    if (!(config.cache.ttl_seconds > 0.0)) {
        error = "cache.ttl_seconds must be > 0";
        return false;
    }
    if (!(config.cache.ttl_seconds <= kMaxTtlSeconds)) {
        error = "cache.ttl_seconds must be <= " + std::to_string(static_cast<int64_t>(kMaxTtlSeconds));
        return false;
    }

    if (config.pool.max_handles < 1) {
        error = "pool.max_handles must be >= 1";
        return false;
    }

    if (!logging::parse_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    std::set<std::string> device_names = {config.directory.device};
    for (const auto &device : config.simulation.devices) {
        if (!validate_device(device, error)) {
            return false;
        }
        if (!device_names.insert(device.name).second) {
            error = "Simulated device '" + device.name + "' defined twice";
            return false;
        }
    }

    return true;
}

bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        warn_unknown_keys(yaml, {"directory", "cache", "pool", "logging", "simulation"}, "");

        if (yaml["directory"]) {
            warn_unknown_keys(yaml["directory"], {"device"}, "directory.");
            if (yaml["directory"]["device"]) {
                config.directory.device = yaml["directory"]["device"].as<std::string>();
            }
        }

        if (yaml["cache"]) {
            warn_unknown_keys(yaml["cache"], {"ttl_seconds"}, "cache.");
            if (yaml["cache"]["ttl_seconds"]) {
                config.cache.ttl_seconds = yaml["cache"]["ttl_seconds"].as<double>();
            }
        }

        if (yaml["pool"]) {
            warn_unknown_keys(yaml["pool"], {"max_handles"}, "pool.");
            if (yaml["pool"]["max_handles"]) {
                config.pool.max_handles = yaml["pool"]["max_handles"].as<int>();
            }
        }

        if (yaml["logging"]) {
            warn_unknown_keys(yaml["logging"], {"level"}, "logging.");
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (yaml["simulation"] && yaml["simulation"]["devices"]) {
            config.simulation.devices.clear();  // Ensure idempotent parsing
            for (const auto &device_node : yaml["simulation"]["devices"]) {
                config.simulation.devices.push_back(parse_device(device_node));
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Directory: " << config.directory.device);
        LOG_INFO("[Config] Cache TTL: " << config.cache.ttl_seconds << "s");
        LOG_INFO("[Config] Pool capacity: " << config.pool.max_handles);
        LOG_INFO("[Config] Log level: " << config.logging.level);
        LOG_INFO("[Config] Simulated devices: " << config.simulation.devices.size());

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace tangorest
