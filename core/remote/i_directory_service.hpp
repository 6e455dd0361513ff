#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "errors/error_record.hpp"
#include "remote_types.hpp"

namespace tangorest {
namespace remote {

/**
 * @brief Closed set of directory operations this layer issues
 *
 * Each operation has fixed wire arguments (a string list) and a fixed reply
 * shape. Whether results may be cached is per-operation metadata, see
 * directory_op_traits().
 */
enum class DirectoryOp {
    GET_DEVICE_WIDE_LIST,      // [wildcard] -> strings: device names
    GET_DEVICE_INFO,           // [device] -> longs + strings
    GET_DEVICE_PROPERTY_LIST,  // [device, wildcard] -> strings: property names
    GET_DEVICE_PROPERTY,       // [device, name...] -> strings: flat property array
    PUT_DEVICE_PROPERTY,       // flat property array -> nothing
    DELETE_DEVICE_PROPERTY     // [device, name...] -> nothing
};

constexpr size_t kDirectoryOpCount = static_cast<size_t>(DirectoryOp::DELETE_DEVICE_PROPERTY) + 1;

struct DirectoryOpTraits {
    DirectoryOp op;
    const char *wire_name;  // Remote command name
    bool cacheable;         // Read-only query, safe to serve from a TTL cache
};

const DirectoryOpTraits &directory_op_traits(DirectoryOp op);
const std::vector<DirectoryOpTraits> &all_directory_ops();
std::optional<DirectoryOp> directory_op_from_wire_name(const std::string &wire_name);

struct DirectoryReply {
    std::vector<int64_t> longs;
    StringList strings;

    bool operator==(const DirectoryReply &other) const {
        return longs == other.longs && strings == other.strings;
    }
};

// Interface for the remote directory (naming / property registry), to enable mocking
class IDirectoryService {
public:
    virtual ~IDirectoryService() = default;

    virtual bool execute(DirectoryOp op, const StringList &args, DirectoryReply &reply,
                         errors::ErrorStack &errors) = 0;
};

}  // namespace remote
}  // namespace tangorest
