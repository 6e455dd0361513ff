#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "remote/i_device_handle.hpp"
#include "remote/i_directory_service.hpp"
#include "sim_system.hpp"

namespace tangorest {
namespace sim {

// Directory service answered by the simulated system; counts forwarded calls per operation
class SimDirectory : public remote::IDirectoryService {
public:
    explicit SimDirectory(std::shared_ptr<SimSystem> system);

    bool execute(remote::DirectoryOp op, const remote::StringList &args, remote::DirectoryReply &reply,
                 errors::ErrorStack &errors) override;

    size_t call_count(remote::DirectoryOp op) const;
    size_t total_calls() const;

private:
    std::shared_ptr<SimSystem> system_;
    std::array<std::atomic<size_t>, remote::kDirectoryOpCount> calls_{};
};

class SimDeviceHandle : public remote::IDeviceHandle {
public:
    SimDeviceHandle(std::shared_ptr<SimSystem> system, std::string name);

    const std::string &name() const override { return name_; }

    bool read_attribute(const std::string &attr, remote::AttributeReading &reading,
                        errors::ErrorStack &errors) override;
    bool read_attributes(const remote::StringList &attrs, std::vector<remote::AttributeReading> &readings,
                         errors::ErrorStack &errors) override;
    bool write_attribute(const std::string &attr, const remote::RemoteValue &value,
                         errors::ErrorStack &errors) override;
    bool write_read_attribute(const std::string &attr, const remote::RemoteValue &value,
                              remote::AttributeReading &reading, errors::ErrorStack &errors) override;

    bool get_attribute_list(remote::StringList &attrs, errors::ErrorStack &errors) override;
    bool get_attribute_config(const remote::StringList &attrs, std::vector<remote::AttributeDescriptor> &descriptors,
                              errors::ErrorStack &errors) override;
    bool set_attribute_config(const remote::AttributeDescriptor &descriptor, errors::ErrorStack &errors) override;
    bool command_list_query(std::vector<remote::CommandInfo> &commands, errors::ErrorStack &errors) override;
    bool get_property_list(const std::string &wildcard, remote::StringList &properties,
                           errors::ErrorStack &errors) override;
    bool info(remote::DeviceInfo &info, errors::ErrorStack &errors) override;
    bool import_info(remote::ImportInfo &info, errors::ErrorStack &errors) override;

private:
    std::shared_ptr<SimSystem> system_;
    std::string name_;
};

// Resolves identifiers against the simulated system; unknown devices fail to connect
class SimConnector : public remote::IDeviceConnector {
public:
    explicit SimConnector(std::shared_ptr<SimSystem> system);

    bool connect(const remote::EntityId &id, std::shared_ptr<remote::IDeviceHandle> &handle,
                 errors::ErrorStack &errors) override;

    size_t connect_count() const { return connects_.load(); }

private:
    std::shared_ptr<SimSystem> system_;
    std::atomic<size_t> connects_{0};
};

}  // namespace sim
}  // namespace tangorest
