#ifndef SOKOBAN_HPP
#define SOKOBAN_HPP

#include <cstddef>
#include <string>

#include "solver/base.hpp"

#define SOKOBAN_DEFAULT_TIMEOUT 60.0
#define SOKOBAN_DEFAULT_MAX_STATES 10000000

// Parse and solve a puzzle in the standard text format. Never throws: every failure is reported in the result.
SolveResult solve_puzzle(const string& puzzle_text, double timeout_seconds = SOKOBAN_DEFAULT_TIMEOUT,
                         size_t max_states = SOKOBAN_DEFAULT_MAX_STATES);

#endif  // SOKOBAN_HPP
