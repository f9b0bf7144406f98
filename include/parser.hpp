#ifndef PARSER_HPP
#define PARSER_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "game.hpp"

typedef vector<string> Grid;  // Rectangular, one string per row

class InvalidPuzzle : public runtime_error {
   public:
    explicit InvalidPuzzle(const string& message) : runtime_error(message) {}
};

typedef struct PuzzleElements {
    optional<Position> player;
    vector<Position> boxes;
    vector<Position> goals;
    vector<Position> walls;
    size_t width, height;
} PuzzleElements;

typedef struct LoadedPuzzle {
    Puzzle puzzle;
    State initial_state;
} LoadedPuzzle;

// Split into rows, drop leading/trailing blank lines and pad rows with spaces to the widest one
Grid parse_puzzle_string(const string& text);

PuzzleElements extract_elements(const Grid& grid);

// Parse, validate and precompute the static deadlock squares. Throws InvalidPuzzle.
LoadedPuzzle load_puzzle(const string& text);

#endif  // PARSER_HPP
