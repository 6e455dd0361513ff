#include "error_envelope.hpp"

namespace tangorest {
namespace errors {

ErrorEnvelope normalize_errors(const ErrorStack &errors, std::chrono::system_clock::time_point now) {
    ErrorEnvelope envelope;
    envelope.errors = errors;
    envelope.timestamp = now;
    return envelope;
}

nlohmann::json error_record_to_json(const ErrorRecord &record) {
    return {{"reason", record.reason},
            {"description", record.description},
            {"severity", severity_to_string(record.severity)},
            {"origin", record.origin}};
}

nlohmann::json to_json(const ErrorEnvelope &envelope) {
    nlohmann::json errors = nlohmann::json::array();
    for (const auto &record : envelope.errors) {
        errors.push_back(error_record_to_json(record));
    }
    return {{"errors", errors}, {"quality", envelope.quality}, {"timestamp", to_epoch_seconds(envelope.timestamp)}};
}

double to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    return static_cast<double>(us) / 1e6;
}

}  // namespace errors
}  // namespace tangorest
