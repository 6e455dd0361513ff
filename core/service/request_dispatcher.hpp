#ifndef TANGOREST_SERVICE_REQUEST_DISPATCHER_HPP
#define TANGOREST_SERVICE_REQUEST_DISPATCHER_HPP

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "device_service.hpp"

namespace tangorest {
namespace service {

// Already-parsed inbound request: operation, target device, string arguments
struct Request {
    std::string operation;
    std::string device;  // "domain/family/member", empty for device-less operations
    // Repeated keys carry multi-valued arguments (property values), in order
    std::vector<std::pair<std::string, std::string>> args;
};

// Known operations, dispatched through a static table
enum class Operation {
    LIST_DEVICES,
    GET_DEVICE,
    GET_STATE,
    LIST_ATTRIBUTES,
    READ_ATTRIBUTES,
    READ_ATTRIBUTE,
    WRITE_ATTRIBUTE,
    WRITE_ATTRIBUTES,
    GET_ATTRIBUTE_INFO,
    UPDATE_ATTRIBUTE_INFO,
    GET_PROPERTIES,
    PUT_PROPERTIES,
    GET_PROPERTY,
    PUT_PROPERTY,
    DELETE_PROPERTY,
    LIST_COMMANDS
};

struct OperationSpec {
    Operation op;
    const char *name;
    bool needs_device;
    const char *usage;
};

const std::vector<OperationSpec> &all_operations();
std::optional<Operation> operation_from_string(const std::string &name);

/**
 * @brief Maps inbound requests onto DeviceService operations
 *
 * Validation failures (unknown operation, malformed device name, missing
 * argument) come back as an envelope with an InvalidRequestError record.
 */
class RequestDispatcher {
public:
    explicit RequestDispatcher(DeviceService &service);

    ServiceResult dispatch(const Request &request);

private:
    ServiceResult dispatch_device_op(Operation op, const remote::EntityId &id, const Request &request);

    DeviceService &service_;
};

}  // namespace service
}  // namespace tangorest

#endif  // TANGOREST_SERVICE_REQUEST_DISPATCHER_HPP
