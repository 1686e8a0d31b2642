#include "wisched/errors.hpp"

namespace wisched {

const char* to_string(ValidationCode code) {
    switch (code) {
        case ValidationCode::NON_FINITE_START: return "start must be finite";
        case ValidationCode::NON_FINITE_FINISH: return "finish must be finite";
        case ValidationCode::NON_FINITE_WEIGHT: return "weight must be finite";
        case ValidationCode::NON_POSITIVE_DURATION: return "start must be less than finish";
        case ValidationCode::NON_POSITIVE_WEIGHT: return "weight must be positive";
    }
    return "unknown validation failure";
}

ValidationError::ValidationError(ValidationCode code, size_t position, const std::string& message)
    : std::invalid_argument(message)
    , code_(code)
    , position_(position) {}

ParseError::ParseError(size_t line, const std::string& message)
    : std::runtime_error("line " + std::to_string(line) + ": " + message)
    , line_(line) {}

} // namespace wisched
