#include "i_directory_service.hpp"

namespace tangorest {
namespace remote {

namespace {

// Only Get-class queries are cacheable; mutations always reach the directory
const std::vector<DirectoryOpTraits> kDirectoryOps = {
    {DirectoryOp::GET_DEVICE_WIDE_LIST, "DbGetDeviceWideList", true},
    {DirectoryOp::GET_DEVICE_INFO, "DbGetDeviceInfo", true},
    {DirectoryOp::GET_DEVICE_PROPERTY_LIST, "DbGetDevicePropertyList", true},
    {DirectoryOp::GET_DEVICE_PROPERTY, "DbGetDeviceProperty", true},
    {DirectoryOp::PUT_DEVICE_PROPERTY, "DbPutDeviceProperty", false},
    {DirectoryOp::DELETE_DEVICE_PROPERTY, "DbDeleteDeviceProperty", false},
};

}  // namespace

const DirectoryOpTraits &directory_op_traits(DirectoryOp op) { return kDirectoryOps.at(static_cast<size_t>(op)); }

const std::vector<DirectoryOpTraits> &all_directory_ops() { return kDirectoryOps; }

std::optional<DirectoryOp> directory_op_from_wire_name(const std::string &wire_name) {
    for (const auto &traits : kDirectoryOps) {
        if (wire_name == traits.wire_name) {
            return traits.op;
        }
    }
    return std::nullopt;
}

}  // namespace remote
}  // namespace tangorest
