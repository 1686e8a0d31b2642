#include <fstream>
#include <iostream>
#include <string>

#include "wisched/dag/compatibility_graph.hpp"
#include "wisched/errors.hpp"
#include "wisched/io/format.hpp"
#include "wisched/io/text_input.hpp"

namespace {

void print_usage(std::ostream& os) {
    os << "Usage: wisched [--verbose] [--dot] [FILE]\n"
       << "Reads lines of \"start finish weight\" from FILE (stdin if omitted or -)\n"
       << "and prints a maximum-weight set of non-overlapping intervals.\n"
       << "\n"
       << "  --verbose   log graph and solve progress\n"
       << "  --dot       print the compatibility graph in DOT form and exit\n"
       << "  --help      show this message\n";
}

} // namespace

int main(int argc, char** argv) {
    bool verbose = false;
    bool dot = false;
    std::string path = "-";
    bool have_path = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--dot") {
            dot = true;
        } else if (!have_path && (arg == "-" || arg.rfind("-", 0) != 0)) {
            path = arg;
            have_path = true;
        } else {
            std::cerr << "Error: unexpected argument '" << arg << "'\n";
            print_usage(std::cerr);
            return 2;
        }
    }

    try {
        wisched::io::TextInput input;
        if (path == "-") {
            input = wisched::io::parse_stream(std::cin);
        } else {
            std::ifstream file(path);
            if (!file.is_open()) {
                std::cerr << "Error: could not open " << path << std::endl;
                return 1;
            }
            input = wisched::io::parse_stream(file);
        }

        if (verbose && !dot) {
            std::cout << "Loaded " << input.triples.size() << " intervals from "
                      << (path == "-" ? "stdin" : path) << std::endl;
        }

        // Validates (with source lines in errors) before any graph output
        auto schedule = wisched::io::solve_text_input(input, verbose && !dot ? &std::cout : nullptr);

        if (dot || verbose) {
            wisched::IntervalStore store;
            for (const auto& t : input.triples) {
                store.add(t.start, t.finish, t.weight);
            }
            wisched::dag::CompatibilityGraph compat(store.snapshot());
            if (dot) {
                std::cout << compat.graph().to_dot();
                return 0;
            }
            compat.graph().print_summary(std::cout);
        }

        std::cout << wisched::io::format_schedule(schedule);
        std::cout << wisched::io::format_summary(schedule) << std::endl;
    } catch (const wisched::ParseError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const wisched::ValidationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
