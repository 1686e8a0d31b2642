#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace wisched {

enum class ValidationCode {
    NON_FINITE_START,
    NON_FINITE_FINISH,
    NON_FINITE_WEIGHT,
    NON_POSITIVE_DURATION,   // start >= finish
    NON_POSITIVE_WEIGHT
};

const char* to_string(ValidationCode code);

/**
 * An input triple violates an interval constraint.
 * position() is the zero-based index of the triple in its input sequence.
 */
class ValidationError : public std::invalid_argument {
public:
    ValidationError(ValidationCode code, size_t position, const std::string& message);

    ValidationCode code() const { return code_; }
    size_t position() const { return position_; }

private:
    ValidationCode code_;
    size_t position_;
};

/**
 * A graph invariant that construction guarantees did not hold.
 * Indicates a bug; never caught inside the library.
 */
class InternalInvariantViolation : public std::logic_error {
public:
    explicit InternalInvariantViolation(const std::string& message)
        : std::logic_error(message) {}
};

/**
 * Malformed line in textual interval input
 */
class ParseError : public std::runtime_error {
public:
    ParseError(size_t line, const std::string& message);

    size_t line() const { return line_; }

private:
    size_t line_;
};

} // namespace wisched
