#ifndef TANGOREST_ERRORS_ERROR_RECORD_HPP
#define TANGOREST_ERRORS_ERROR_RECORD_HPP

#include <string>
#include <vector>

namespace tangorest {
namespace errors {

/**
 * @brief Severity carried by a single error record
 *
 * Mirrors the remote control system's three-level severity model.
 */
enum class ErrorSeverity { WARN, ERR, PANIC };

inline const char *severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::WARN:
            return "WARN";
        case ErrorSeverity::ERR:
            return "ERR";
        case ErrorSeverity::PANIC:
            return "PANIC";
        default:
            return "ERR";
    }
}

/**
 * @brief Error classes raised by this layer
 *
 * Remote failures arrive with their own reason strings; these kinds are only
 * used for records created locally.
 */
enum class ErrorKind { CONNECTION, REMOTE_CALL, VALUE_COERCION, MALFORMED_WIRE_DATA, INVALID_REQUEST };

inline const char *error_kind_to_reason(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONNECTION:
            return "ConnectionError";
        case ErrorKind::REMOTE_CALL:
            return "RemoteCallError";
        case ErrorKind::VALUE_COERCION:
            return "ValueCoercionError";
        case ErrorKind::MALFORMED_WIRE_DATA:
            return "MalformedWireDataError";
        case ErrorKind::INVALID_REQUEST:
            return "InvalidRequestError";
        default:
            return "RemoteCallError";
    }
}

struct ErrorRecord {
    std::string reason;
    std::string description;
    ErrorSeverity severity = ErrorSeverity::ERR;
    std::string origin;

    bool operator==(const ErrorRecord &other) const {
        return reason == other.reason && description == other.description && severity == other.severity &&
               origin == other.origin;
    }
};

// Ordered cause list, in the order the remote system reported it
using ErrorStack = std::vector<ErrorRecord>;

inline ErrorRecord make_error(ErrorKind kind, const std::string &description, const std::string &origin) {
    return ErrorRecord{error_kind_to_reason(kind), description, ErrorSeverity::ERR, origin};
}

// Appends a local record only when the remote side supplied no cause at all
inline void ensure_cause(ErrorStack &errors, ErrorKind kind, const std::string &description,
                         const std::string &origin) {
    if (errors.empty()) {
        errors.push_back(make_error(kind, description, origin));
    }
}

}  // namespace errors
}  // namespace tangorest

#endif  // TANGOREST_ERRORS_ERROR_RECORD_HPP
