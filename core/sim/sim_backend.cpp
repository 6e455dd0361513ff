#include "sim_backend.hpp"

#include "logging/logger.hpp"

namespace tangorest {
namespace sim {

SimDirectory::SimDirectory(std::shared_ptr<SimSystem> system) : system_(std::move(system)) {}

bool SimDirectory::execute(remote::DirectoryOp op, const remote::StringList &args, remote::DirectoryReply &reply,
                           errors::ErrorStack &errors) {
    const auto index = static_cast<size_t>(op);
    if (index < calls_.size()) {
        ++calls_[index];
    }
    LOG_DEBUG("[SimDirectory] " << remote::directory_op_traits(op).wire_name << " (" << args.size() << " args)");
    return system_->directory_execute(op, args, reply, errors);
}

size_t SimDirectory::call_count(remote::DirectoryOp op) const {
    const auto index = static_cast<size_t>(op);
    return index < calls_.size() ? calls_[index].load() : 0;
}

size_t SimDirectory::total_calls() const {
    size_t total = 0;
    for (const auto &count : calls_) {
        total += count.load();
    }
    return total;
}

SimDeviceHandle::SimDeviceHandle(std::shared_ptr<SimSystem> system, std::string name)
    : system_(std::move(system)), name_(std::move(name)) {}

bool SimDeviceHandle::read_attribute(const std::string &attr, remote::AttributeReading &reading,
                                     errors::ErrorStack &errors) {
    return system_->read_attribute(name_, attr, reading, errors);
}

bool SimDeviceHandle::read_attributes(const remote::StringList &attrs, std::vector<remote::AttributeReading> &readings,
                                      errors::ErrorStack &errors) {
    std::vector<remote::AttributeReading> out;
    out.reserve(attrs.size());
    for (const auto &attr : attrs) {
        remote::AttributeReading reading;
        if (!system_->read_attribute(name_, attr, reading, errors)) {
            return false;
        }
        out.push_back(std::move(reading));
    }
    readings = std::move(out);
    return true;
}

bool SimDeviceHandle::write_attribute(const std::string &attr, const remote::RemoteValue &value,
                                      errors::ErrorStack &errors) {
    return system_->write_attribute(name_, attr, value, errors);
}

bool SimDeviceHandle::write_read_attribute(const std::string &attr, const remote::RemoteValue &value,
                                           remote::AttributeReading &reading, errors::ErrorStack &errors) {
    return system_->write_read_attribute(name_, attr, value, reading, errors);
}

bool SimDeviceHandle::get_attribute_list(remote::StringList &attrs, errors::ErrorStack &errors) {
    return system_->attribute_list(name_, attrs, errors);
}

bool SimDeviceHandle::get_attribute_config(const remote::StringList &attrs,
                                           std::vector<remote::AttributeDescriptor> &descriptors,
                                           errors::ErrorStack &errors) {
    std::vector<remote::AttributeDescriptor> out;
    out.reserve(attrs.size());
    for (const auto &attr : attrs) {
        remote::AttributeDescriptor descriptor;
        if (!system_->attribute_config(name_, attr, descriptor, errors)) {
            return false;
        }
        out.push_back(std::move(descriptor));
    }
    descriptors = std::move(out);
    return true;
}

bool SimDeviceHandle::set_attribute_config(const remote::AttributeDescriptor &descriptor, errors::ErrorStack &errors) {
    return system_->set_attribute_config(name_, descriptor, errors);
}

bool SimDeviceHandle::command_list_query(std::vector<remote::CommandInfo> &commands, errors::ErrorStack &errors) {
    return system_->commands(name_, commands, errors);
}

bool SimDeviceHandle::get_property_list(const std::string &wildcard, remote::StringList &properties,
                                        errors::ErrorStack &errors) {
    return system_->property_names(name_, wildcard, properties, errors);
}

bool SimDeviceHandle::info(remote::DeviceInfo &info, errors::ErrorStack &errors) {
    return system_->device_info(name_, info, errors);
}

bool SimDeviceHandle::import_info(remote::ImportInfo &info, errors::ErrorStack &errors) {
    return system_->import_info(name_, info, errors);
}

SimConnector::SimConnector(std::shared_ptr<SimSystem> system) : system_(std::move(system)) {}

bool SimConnector::connect(const remote::EntityId &id, std::shared_ptr<remote::IDeviceHandle> &handle,
                           errors::ErrorStack &errors) {
    ++connects_;
    if (!system_->has_device(id.str())) {
        errors.push_back(errors::ErrorRecord{"API_DeviceNotDefined",
                                             "Device " + id.str() + " is not defined in the database",
                                             errors::ErrorSeverity::ERR, "SimConnector::connect"});
        return false;
    }
    handle = std::make_shared<SimDeviceHandle>(system_, id.str());
    return true;
}

}  // namespace sim
}  // namespace tangorest
