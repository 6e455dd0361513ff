#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tangorest {
namespace sim {

struct SimAttributeConfig {
    std::string name;
    std::string type = "double";    // DevDouble / double, DevLong / long, ...
    std::string format = "scalar";  // scalar | spectrum
    std::string writable = "read";  // read | read_write | read_with_write | write
    std::string value;              // Initial value, in request string form
    std::optional<double> min;      // Clamp range for writes
    std::optional<double> max;
    std::string unit;
    std::string label;
    std::vector<std::string> enum_labels;
    int max_dim_x = 1;
};

struct SimCommandConfig {
    std::string name;
    std::string in_type = "DevVoid";
    std::string out_type = "DevVoid";
    std::string in_type_desc = "Uninitialised";
    std::string out_type_desc = "Uninitialised";
};

struct SimDeviceConfig {
    std::string name;  // domain/family/member
    std::string class_name = "SimDevice";
    std::string server = "SimServer/1";
    std::string host = "localhost";
    std::string state = "ON";
    std::string status;
    bool exported = true;
    std::map<std::string, std::vector<std::string>> properties;
    std::vector<SimAttributeConfig> attributes;
    std::vector<SimCommandConfig> commands;
};

// In-process stand-in for the remote control system
struct SimulationConfig {
    std::vector<SimDeviceConfig> devices;
};

}  // namespace sim
}  // namespace tangorest
