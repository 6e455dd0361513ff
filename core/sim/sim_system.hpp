#ifndef TANGOREST_SIM_SIM_SYSTEM_HPP
#define TANGOREST_SIM_SIM_SYSTEM_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "errors/error_record.hpp"
#include "remote/i_directory_service.hpp"
#include "remote/remote_types.hpp"
#include "sim_config.hpp"

namespace tangorest {
namespace sim {

struct SimAttribute {
    remote::AttributeDescriptor descriptor;
    remote::RemoteValue value;
    std::optional<remote::RemoteValue> w_value;
    std::optional<double> min;
    std::optional<double> max;
    std::chrono::system_clock::time_point updated;
};

struct SimDevice {
    std::string name;
    std::string class_name;
    std::string server;
    std::string host;
    bool exported = true;
    int64_t pid = 0;
    std::string started_date;
    std::string stopped_date;
    std::vector<std::string> attribute_order;
    std::map<std::string, SimAttribute> attributes;
    std::vector<remote::CommandInfo> commands;
    std::map<std::string, std::vector<std::string>> properties;
};

/**
 * @brief In-memory control system: device directory plus live devices
 *
 * Behaves like a remote endpoint from the caller's point of view: failures
 * come back as remote-style error records (API_*, DB_* reasons). Numeric
 * writes are clamped to the attribute's configured min/max, so the
 * committed value can differ from the requested one.
 *
 * Thread-safe; every call takes the system mutex.
 */
class SimSystem {
public:
    SimSystem() = default;

    SimSystem(const SimSystem &) = delete;
    SimSystem &operator=(const SimSystem &) = delete;

    // Build devices from config; `directory_device` is registered as the directory itself
    bool load(const SimulationConfig &config, const std::string &directory_device, std::string &error);

    // Directory side
    bool directory_execute(remote::DirectoryOp op, const remote::StringList &args, remote::DirectoryReply &reply,
                           errors::ErrorStack &errors);

    // Device side
    bool has_device(const std::string &device) const;
    bool read_attribute(const std::string &device, const std::string &attr, remote::AttributeReading &reading,
                        errors::ErrorStack &errors) const;
    bool write_attribute(const std::string &device, const std::string &attr, const remote::RemoteValue &value,
                         errors::ErrorStack &errors);
    // Write then read back under one lock; the reading is this write's committed value
    bool write_read_attribute(const std::string &device, const std::string &attr, const remote::RemoteValue &value,
                              remote::AttributeReading &reading, errors::ErrorStack &errors);
    bool attribute_list(const std::string &device, remote::StringList &attrs, errors::ErrorStack &errors) const;
    bool attribute_config(const std::string &device, const std::string &attr, remote::AttributeDescriptor &descriptor,
                          errors::ErrorStack &errors) const;
    bool set_attribute_config(const std::string &device, const remote::AttributeDescriptor &descriptor,
                              errors::ErrorStack &errors);
    bool commands(const std::string &device, std::vector<remote::CommandInfo> &commands,
                  errors::ErrorStack &errors) const;
    bool property_names(const std::string &device, const std::string &wildcard, remote::StringList &names,
                        errors::ErrorStack &errors) const;
    bool device_info(const std::string &device, remote::DeviceInfo &info, errors::ErrorStack &errors) const;
    bool import_info(const std::string &device, remote::ImportInfo &info, errors::ErrorStack &errors) const;

    size_t device_count() const;

private:
    const SimDevice *find_device(const std::string &device, errors::ErrorStack &errors, const char *origin) const;
    SimDevice *find_device(const std::string &device, errors::ErrorStack &errors, const char *origin);

    mutable std::mutex mutex_;
    std::map<std::string, SimDevice> devices_;
};

// Case-insensitive '*' glob used for device and property wildcards
bool wildcard_match(const std::string &pattern, const std::string &text);

}  // namespace sim
}  // namespace tangorest

#endif  // TANGOREST_SIM_SIM_SYSTEM_HPP
