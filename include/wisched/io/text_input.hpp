#pragma once

#include "../scheduler.hpp"
#include <istream>
#include <string>
#include <vector>

namespace wisched {
namespace io {

/**
 * Triples read from text, with the 1-based source line of each
 */
struct TextInput {
    std::vector<Triple> triples;
    std::vector<size_t> line_numbers;
};

/**
 * Parses lines of the form "start finish weight".
 * '#' begins a comment; blank lines are skipped.
 * Throws ParseError on a wrong field count or a non-numeric token.
 */
TextInput parse_lines(const std::vector<std::string>& lines);
TextInput parse_stream(std::istream& in);

/**
 * Parse + solve. A ValidationError is rethrown with the offending
 * source line prefixed to its message; position() is kept.
 */
Schedule solve_text_input(const std::vector<std::string>& lines, std::ostream* log = nullptr);
Schedule solve_text_input(const TextInput& input, std::ostream* log = nullptr);

} // namespace io
} // namespace wisched
