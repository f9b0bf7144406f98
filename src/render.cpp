#include "render.hpp"

#include <vector>

using namespace std;

string state_to_string(const State& state, const Puzzle& puzzle) {
    vector<string> map_vis(puzzle.height, string(puzzle.width, ' '));

    Position pos;
    for (pos.y = 0; static_cast<size_t>(pos.y) < puzzle.height; ++pos.y) {
        for (pos.x = 0; static_cast<size_t>(pos.x) < puzzle.width; ++pos.x) {
            char& cell = map_vis[pos.y][pos.x];
            if (puzzle.is_wall(pos)) {
                cell = '#';
            } else if (state.has_box(pos)) {
                cell = puzzle.is_goal(pos) ? '*' : '$';
            } else if (pos == state.player) {
                cell = puzzle.is_goal(pos) ? '+' : '@';
            } else if (puzzle.is_goal(pos)) {
                cell = '.';
            }
        }
    }

    string output;
    for (size_t y = 0; y < map_vis.size(); ++y) {
        if (y > 0) output += '\n';
        output += map_vis[y];
    }
    return output;
}
