#pragma once

#include <memory>
#include <string>
#include <vector>

#include "entity_id.hpp"
#include "errors/error_record.hpp"
#include "remote_types.hpp"

namespace tangorest {
namespace remote {

// Interface for a live handle to one remote device, to enable mocking
//
// Every call is a blocking round trip. On failure it returns false and
// appends the remote's ordered cause list to `errors`.
class IDeviceHandle {
public:
    virtual ~IDeviceHandle() = default;

    virtual const std::string &name() const = 0;

    // Attribute access
    virtual bool read_attribute(const std::string &attr, AttributeReading &reading, errors::ErrorStack &errors) = 0;

    virtual bool read_attributes(const StringList &attrs, std::vector<AttributeReading> &readings,
                                 errors::ErrorStack &errors) = 0;

    virtual bool write_attribute(const std::string &attr, const RemoteValue &value, errors::ErrorStack &errors) = 0;

    // Combined write + read back in a single round trip
    virtual bool write_read_attribute(const std::string &attr, const RemoteValue &value, AttributeReading &reading,
                                      errors::ErrorStack &errors) = 0;

    // Metadata
    virtual bool get_attribute_list(StringList &attrs, errors::ErrorStack &errors) = 0;

    virtual bool get_attribute_config(const StringList &attrs, std::vector<AttributeDescriptor> &descriptors,
                                      errors::ErrorStack &errors) = 0;

    virtual bool set_attribute_config(const AttributeDescriptor &descriptor, errors::ErrorStack &errors) = 0;

    virtual bool command_list_query(std::vector<CommandInfo> &commands, errors::ErrorStack &errors) = 0;

    virtual bool get_property_list(const std::string &wildcard, StringList &properties,
                                   errors::ErrorStack &errors) = 0;

    virtual bool info(DeviceInfo &info, errors::ErrorStack &errors) = 0;

    virtual bool import_info(ImportInfo &info, errors::ErrorStack &errors) = 0;
};

// Creates handles for identifiers; fails when the remote cannot resolve one
class IDeviceConnector {
public:
    virtual ~IDeviceConnector() = default;

    virtual bool connect(const EntityId &id, std::shared_ptr<IDeviceHandle> &handle, errors::ErrorStack &errors) = 0;
};

}  // namespace remote
}  // namespace tangorest
