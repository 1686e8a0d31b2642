#include "wisched/io/text_input.hpp"
#include "wisched/errors.hpp"
#include <cstdlib>
#include <sstream>

namespace wisched {
namespace io {

namespace {

double parse_number(const std::string& token, size_t line) {
    const char* begin = token.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);

    if (end == begin || *end != '\0') {
        throw ParseError(line, "'" + token + "' is not a number");
    }
    // Overflow gives +-HUGE_VAL (infinite), left for validation to reject
    return value;
}

} // namespace

TextInput parse_lines(const std::vector<std::string>& lines) {
    TextInput input;

    for (size_t i = 0; i < lines.size(); ++i) {
        const size_t line_number = i + 1;
        std::string content = lines[i].substr(0, lines[i].find('#'));

        std::istringstream iss(content);
        std::vector<std::string> fields;
        std::string token;
        while (iss >> token) {
            fields.push_back(token);
        }

        if (fields.empty()) continue;

        if (fields.size() != 3) {
            throw ParseError(
                line_number,
                "expected 3 fields (start finish weight), got " + std::to_string(fields.size())
            );
        }

        Triple triple;
        triple.start = parse_number(fields[0], line_number);
        triple.finish = parse_number(fields[1], line_number);
        triple.weight = parse_number(fields[2], line_number);

        input.triples.push_back(triple);
        input.line_numbers.push_back(line_number);
    }

    return input;
}

TextInput parse_stream(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return parse_lines(lines);
}

Schedule solve_text_input(const std::vector<std::string>& lines, std::ostream* log) {
    return solve_text_input(parse_lines(lines), log);
}

Schedule solve_text_input(const TextInput& input, std::ostream* log) {
    try {
        return solve(input.triples, log);
    } catch (const ValidationError& e) {
        size_t line = e.position() < input.line_numbers.size()
            ? input.line_numbers[e.position()]
            : e.position() + 1;
        throw ValidationError(
            e.code(),
            e.position(),
            "line " + std::to_string(line) + ": " + e.what()
        );
    }
}

} // namespace io
} // namespace wisched
