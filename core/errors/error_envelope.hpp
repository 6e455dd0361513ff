#ifndef TANGOREST_ERRORS_ERROR_ENVELOPE_HPP
#define TANGOREST_ERRORS_ERROR_ENVELOPE_HPP

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

#include "error_record.hpp"

namespace tangorest {
namespace errors {

/**
 * @brief Uniform failure shape returned by every operation
 *
 * The normalizer is a structural pass-through: records keep the order and
 * content the remote system gave them, reason and origin are never inspected.
 */
struct ErrorEnvelope {
    ErrorStack errors;
    std::string quality = "FAILURE";
    std::chrono::system_clock::time_point timestamp;
};

ErrorEnvelope normalize_errors(const ErrorStack &errors,
                               std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

nlohmann::json error_record_to_json(const ErrorRecord &record);
nlohmann::json to_json(const ErrorEnvelope &envelope);

// Seconds since epoch with sub-second precision
double to_epoch_seconds(std::chrono::system_clock::time_point tp);

}  // namespace errors
}  // namespace tangorest

#endif  // TANGOREST_ERRORS_ERROR_ENVELOPE_HPP
