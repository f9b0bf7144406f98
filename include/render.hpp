#ifndef RENDER_HPP
#define RENDER_HPP

#include <string>

#include "game.hpp"

// Draw the state in the puzzle text format, rows separated by '\n'
string state_to_string(const State& state, const Puzzle& puzzle);

#endif  // RENDER_HPP
