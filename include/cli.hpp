#ifndef CLI_HPP
#define CLI_HPP

#include <cstddef>
#include <string>

#include "sokoban.hpp"

typedef struct Options {
    string puzzle_file;
    double timeout = SOKOBAN_DEFAULT_TIMEOUT;
    size_t max_states = SOKOBAN_DEFAULT_MAX_STATES;
    bool verbose = false;
    bool visualize = false;
    bool lurd = false;
    double delay = 0.3;
} Options;

// Whole-string non-negative values only: "-5", "12abc" and "" are rejected
bool parse_count(const string& text, size_t& value);
bool parse_seconds(const string& text, double& value);

void print_usage(const char* program);

// Reports the offending argument on stderr and returns false on bad input or a missing puzzle file
bool parse_args(int argc, char* argv[], Options& options);

#endif  // CLI_HPP
