#include "cli.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

using namespace std;

bool parse_count(const string& text, size_t& value) {
    if (text.empty() || !isdigit(static_cast<unsigned char>(text[0]))) return false;
    try {
        size_t used = 0;
        unsigned long long parsed = stoull(text, &used);
        if (used != text.size()) return false;
        value = static_cast<size_t>(parsed);
        return true;
    } catch (const out_of_range&) {
        return false;
    }
}

bool parse_seconds(const string& text, double& value) {
    if (text.empty() || !(isdigit(static_cast<unsigned char>(text[0])) || text[0] == '.')) return false;
    try {
        size_t used = 0;
        double parsed = stod(text, &used);
        if (used != text.size()) return false;
        value = parsed;
        return true;
    } catch (const logic_error&) {
        return false;
    }
}

void print_usage(const char* program) {
    cerr << "Usage: " << program
         << " <puzzle_file> [-t|--timeout SECONDS] [-m|--max-states N] [-v|--verbose] [--visualize]"
            " [--delay SECONDS] [--lurd]"
         << endl;
}

bool parse_args(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        bool valid = true;
        if ((arg == "-t" || arg == "--timeout") && i + 1 < argc) {
            valid = parse_seconds(argv[++i], options.timeout);
        } else if ((arg == "-m" || arg == "--max-states") && i + 1 < argc) {
            valid = parse_count(argv[++i], options.max_states);
        } else if (arg == "--delay" && i + 1 < argc) {
            valid = parse_seconds(argv[++i], options.delay);
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--visualize") {
            options.visualize = true;
        } else if (arg == "--lurd") {
            options.lurd = true;
        } else if (!arg.empty() && arg[0] != '-' && options.puzzle_file.empty()) {
            options.puzzle_file = arg;
        } else {
            cerr << "Error: Unexpected argument '" << arg << "'" << endl;
            return false;
        }

        if (!valid) {
            cerr << "Error: Invalid value '" << argv[i] << "' for " << arg << endl;
            return false;
        }
    }
    return !options.puzzle_file.empty();
}
