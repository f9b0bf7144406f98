#ifndef GAME_HPP
#define GAME_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

using namespace std;

typedef vector<bool> Map;  // One flag per grid cell, indexed by Puzzle::index()

class Position;
class State;
class Puzzle;

// enum Direction

enum Direction {
    UP = 0,
    DOWN = 1,
    LEFT = 2,
    RIGHT = 3,
};

const Direction DIRECTIONS[4] = {Direction::UP, Direction::DOWN, Direction::LEFT, Direction::RIGHT};

typedef struct DirectionDelta {
    int8_t dx, dy;
} DirectionDelta;

const DirectionDelta DIRECTION_DELTAS[4] = {
    {0, -1},  // Up
    {0, 1},   // Down
    {-1, 0},  // Left
    {1, 0},   // Right
};

inline DirectionDelta dir_to_delta(const Direction& dir) { return DIRECTION_DELTAS[dir]; }

inline char dir_to_str(const Direction& dir) {
    switch (dir) {
        case Direction::UP:
            return 'U';
        case Direction::DOWN:
            return 'D';
        case Direction::LEFT:
            return 'L';
        case Direction::RIGHT:
            return 'R';
        default:
            return 'X';
    }
}

// Returns false for anything outside UDLR
bool str_to_dir(char c, Direction& dir);

// class Position

class Position {
   public:
    int x, y;

    Position();
    Position(int x, int y);

    Position operator+(const Direction& dir) const;
    Position operator-(const Direction& dir) const;
    bool operator==(const Position& other) const;
    bool operator!=(const Position& other) const;
    bool operator<(const Position& other) const;
};

// A single box push: the edge label of the search graph
typedef struct Push {
    Direction dir;
    Position from, to;
} Push;

// class State

class State {
   public:
    Position player;
    vector<Position> boxes;  // Sorted and unique

    State();
    State(Position player, vector<Position> boxes);

    bool has_box(const Position& pos) const;
    State push(const Position& box, const Direction& dir) const;

    uint64_t hash() const;
    bool operator==(const State& other) const;
    bool operator!=(const State& other) const;
};

namespace std {
template <>
struct hash<State> {
    size_t operator()(const State& state) const { return static_cast<size_t>(state.hash()); }
};
}  // namespace std

// class Puzzle

class Puzzle {
   public:
    size_t width, height;
    Map walls;
    Map targets;
    Map deadlock_squares;
    vector<Position> goals;  // Sorted and unique

    Puzzle();
    Puzzle(size_t width, size_t height, const vector<Position>& wall_list, const vector<Position>& goal_list);

    void set_deadlock_squares(const vector<Position>& squares);

    inline bool pos_valid(const Position& pos) const {
        return pos.x >= 0 && pos.y >= 0 && static_cast<size_t>(pos.x) < width && static_cast<size_t>(pos.y) < height;
    }
    inline size_t index(const Position& pos) const { return static_cast<size_t>(pos.y) * width + pos.x; }
    inline size_t size() const { return width * height; }

    inline bool is_wall(const Position& pos) const { return pos_valid(pos) && walls[index(pos)]; }
    inline bool is_goal(const Position& pos) const { return pos_valid(pos) && targets[index(pos)]; }
    inline bool is_deadlock_square(const Position& pos) const { return pos_valid(pos) && deadlock_squares[index(pos)]; }

    bool is_solved(const State& state) const { return state.boxes == goals; }
    bool has_dead_box(const State& state) const;
};

#endif  // GAME_HPP
