#include "deadlock.hpp"

#include <algorithm>

using namespace std;

bool is_corner_deadlock(const Position& pos, const Puzzle& puzzle) {
    static const Direction corner_dirs[4][2] = {
        {UP, LEFT},
        {UP, RIGHT},
        {DOWN, LEFT},
        {DOWN, RIGHT},
    };

    if (puzzle.is_goal(pos)) return false;  // Goal is never dead

    for (const Direction* comb : corner_dirs) {
        if (puzzle.is_wall(pos + comb[0]) && puzzle.is_wall(pos + comb[1])) return true;
    }

    return false;
}

vector<Position> compute_static_deadlocks(const Puzzle& puzzle) {
    vector<Position> deadlocks;

    Position pos;
    for (pos.y = 0; static_cast<size_t>(pos.y) < puzzle.height; pos.y++) {
        for (pos.x = 0; static_cast<size_t>(pos.x) < puzzle.width; pos.x++) {
            if (puzzle.is_wall(pos) || puzzle.is_goal(pos)) continue;
            if (is_corner_deadlock(pos, puzzle)) deadlocks.push_back(pos);
        }
    }

    return deadlocks;
}

bool is_freeze_deadlock(const vector<Position>& boxes, const Puzzle& puzzle) {
    vector<Position> box_set = boxes;
    sort(box_set.begin(), box_set.end());
    auto has_box = [&](const Position& pos) { return binary_search(box_set.begin(), box_set.end(), pos); };

    for (const Position& box : box_set) {
        if (puzzle.is_goal(box)) continue;

        bool can_move = false;
        for (Direction dir : DIRECTIONS) {
            Position new_box = box + dir;
            Position push_from = box - dir;
            // Off-grid squares block like walls
            bool dest_blocked = !puzzle.pos_valid(new_box) || puzzle.is_wall(new_box) || has_box(new_box);
            bool from_blocked = !puzzle.pos_valid(push_from) || puzzle.is_wall(push_from);
            if (!dest_blocked && !from_blocked) {
                can_move = true;
                break;
            }
        }

        if (!can_move) return true;
    }

    return false;
}

bool is_2x2_deadlock(const vector<Position>& boxes, const Puzzle& puzzle) {
    vector<Position> box_set = boxes;
    sort(box_set.begin(), box_set.end());
    auto has_box = [&](const Position& pos) { return binary_search(box_set.begin(), box_set.end(), pos); };

    // Each block is only visited from its top-left box
    for (const Position& box : box_set) {
        Position square[4] = {box, box + RIGHT, box + DOWN, box + DOWN + RIGHT};
        bool filled = all_of(square, square + 4, has_box);
        if (!filled) continue;

        bool all_goals = all_of(square, square + 4, [&](const Position& pos) { return puzzle.is_goal(pos); });
        if (!all_goals) return true;
    }

    return false;
}

bool is_deadlocked(const State& state, const Puzzle& puzzle) {
    // Cheap lookup first
    if (puzzle.has_dead_box(state)) return true;

    if (is_freeze_deadlock(state.boxes, puzzle)) return true;
    if (is_2x2_deadlock(state.boxes, puzzle)) return true;

    return false;
}
