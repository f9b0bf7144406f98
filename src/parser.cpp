#include "parser.hpp"

#include <algorithm>
#include <sstream>

#include "deadlock.hpp"

using namespace std;

static bool is_blank(const string& line) {
    return all_of(line.begin(), line.end(), [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f'; });
}

Grid parse_puzzle_string(const string& text) {
    vector<string> lines;
    istringstream stream(text);
    string line;
    while (getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }

    while (!lines.empty() && is_blank(lines.back())) lines.pop_back();
    size_t first = 0;
    while (first < lines.size() && is_blank(lines[first])) first++;
    lines.erase(lines.begin(), lines.begin() + first);

    if (lines.empty()) return {};

    size_t width = 0;
    for (const string& row : lines) width = max(width, row.size());

    Grid grid;
    for (string& row : lines) {
        row.resize(width, ' ');
        grid.push_back(row);
    }
    return grid;
}

PuzzleElements extract_elements(const Grid& grid) {
    PuzzleElements elements;
    elements.height = grid.size();
    elements.width = grid.empty() ? 0 : grid[0].size();

    Position pos;
    for (pos.y = 0; static_cast<size_t>(pos.y) < elements.height; pos.y++) {
        const string& row = grid[pos.y];
        if (row.size() != elements.width) throw InvalidPuzzle("Inconsistent row width");

        for (pos.x = 0; static_cast<size_t>(pos.x) < elements.width; pos.x++) {
            char cell = row[pos.x];
            if (cell == '#') {
                elements.walls.push_back(pos);
            } else if (cell == '@') {
                elements.player = pos;
            } else if (cell == '$') {
                elements.boxes.push_back(pos);
            } else if (cell == '.') {
                elements.goals.push_back(pos);
            } else if (cell == '+') {  // Player on goal
                elements.player = pos;
                elements.goals.push_back(pos);
            } else if (cell == '*') {  // Box on goal
                elements.boxes.push_back(pos);
                elements.goals.push_back(pos);
            }
        }
    }

    return elements;
}

LoadedPuzzle load_puzzle(const string& text) {
    Grid grid = parse_puzzle_string(text);
    if (grid.empty()) throw InvalidPuzzle("Empty puzzle");

    PuzzleElements elements = extract_elements(grid);
    if (!elements.player) throw InvalidPuzzle("No player found in puzzle");
    if (elements.boxes.empty()) throw InvalidPuzzle("No boxes found in puzzle");
    if (elements.goals.empty()) throw InvalidPuzzle("No goals found in puzzle");
    if (elements.boxes.size() != elements.goals.size()) {
        ostringstream message;
        message << "Box count (" << elements.boxes.size() << ") != goal count (" << elements.goals.size() << ")";
        throw InvalidPuzzle(message.str());
    }

    LoadedPuzzle loaded;
    loaded.puzzle = Puzzle(elements.width, elements.height, elements.walls, elements.goals);
    loaded.puzzle.set_deadlock_squares(compute_static_deadlocks(loaded.puzzle));
    loaded.initial_state = State(elements.player.value(), elements.boxes);
    return loaded;
}
