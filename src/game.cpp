#include "game.hpp"

#include <algorithm>

using namespace std;

bool str_to_dir(char c, Direction& dir) {
    switch (c) {
        case 'U':
            dir = Direction::UP;
            return true;
        case 'D':
            dir = Direction::DOWN;
            return true;
        case 'L':
            dir = Direction::LEFT;
            return true;
        case 'R':
            dir = Direction::RIGHT;
            return true;
        default:
            return false;
    }
}

// class Position implementation

Position::Position() : x(0), y(0) {}

Position::Position(int x, int y) : x(x), y(y) {}

Position Position::operator+(const Direction& dir) const {
    DirectionDelta delta = dir_to_delta(dir);
    return Position(x + delta.dx, y + delta.dy);
}

Position Position::operator-(const Direction& dir) const {
    DirectionDelta delta = dir_to_delta(dir);
    return Position(x - delta.dx, y - delta.dy);
}

bool Position::operator==(const Position& other) const { return x == other.x && y == other.y; }

bool Position::operator!=(const Position& other) const { return !(*this == other); }

bool Position::operator<(const Position& other) const { return (y < other.y) || (y == other.y && x < other.x); }

// class State implementation

State::State() : player(0, 0) {}

State::State(Position player, vector<Position> boxes) : player(player), boxes(move(boxes)) {
    sort(this->boxes.begin(), this->boxes.end());
    this->boxes.erase(unique(this->boxes.begin(), this->boxes.end()), this->boxes.end());
}

bool State::has_box(const Position& pos) const { return binary_search(boxes.begin(), boxes.end(), pos); }

State State::push(const Position& box, const Direction& dir) const {
    Position new_box = box + dir;
    vector<Position> new_boxes = boxes;

    auto it = lower_bound(new_boxes.begin(), new_boxes.end(), box);
    new_boxes.erase(it);
    new_boxes.insert(lower_bound(new_boxes.begin(), new_boxes.end(), new_box), new_box);

    // The player ends up where the box was
    State next;
    next.player = box;
    next.boxes = move(new_boxes);
    return next;
}

uint64_t State::hash() const {
    // FNV-1a over the player and the sorted box coordinates
    const uint64_t prime = 1099511628211ULL;
    uint64_t h = 14695981039346656037ULL;
    auto mix = [&](int v) {
        h ^= static_cast<uint32_t>(v);
        h *= prime;
    };

    mix(player.x);
    mix(player.y);
    for (const Position& box : boxes) {
        mix(box.x);
        mix(box.y);
    }
    return h;
}

bool State::operator==(const State& other) const { return player == other.player && boxes == other.boxes; }

bool State::operator!=(const State& other) const { return !(*this == other); }

// class Puzzle implementation

Puzzle::Puzzle() : width(0), height(0) {}

Puzzle::Puzzle(size_t width, size_t height, const vector<Position>& wall_list, const vector<Position>& goal_list)
    : width(width), height(height) {
    walls.assign(size(), false);
    targets.assign(size(), false);
    deadlock_squares.assign(size(), false);

    for (const Position& wall : wall_list) walls[index(wall)] = true;
    for (const Position& goal : goal_list) {
        if (targets[index(goal)]) continue;
        targets[index(goal)] = true;
        goals.push_back(goal);
    }
    sort(goals.begin(), goals.end());
}

void Puzzle::set_deadlock_squares(const vector<Position>& squares) {
    deadlock_squares.assign(size(), false);
    for (const Position& pos : squares) {
        if (pos_valid(pos)) deadlock_squares[index(pos)] = true;
    }
}

bool Puzzle::has_dead_box(const State& state) const {
    for (const Position& box : state.boxes) {
        if (is_deadlock_square(box)) return true;
    }
    return false;
}
