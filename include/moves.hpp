#ifndef MOVES_HPP
#define MOVES_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "game.hpp"

typedef pair<Push, State> Successor;  // (push performed, resulting state)

class IllegalReplay : public runtime_error {
   public:
    explicit IllegalReplay(const string& message) : runtime_error(message) {}
};

// Squares the player can walk to without pushing, boxes act as obstacles
Map reachable(const Position& player, const vector<Position>& boxes, const Puzzle& puzzle);

// All legal pushes from the state, in box order then U, D, L, R
vector<Successor> generate_moves(const State& state, const Puzzle& puzzle);

// Push the first box (row-major) that can move in the given direction. Throws IllegalReplay if none can.
State apply_move(const State& state, const Direction& dir, const Puzzle& puzzle);

// Replay a push on a known box. Throws IllegalReplay if that push is not legal.
State apply_push(const State& state, const Push& push, const Puzzle& puzzle);

// Recover which box each letter of a solution moves, trying every candidate box until the whole string
// ends solved. Throws IllegalReplay when no assignment works.
vector<Push> resolve_pushes(const State& initial_state, const string& solution, const Puzzle& puzzle);

// Every state along the solution, starting with the initial one
vector<State> replay_pushes(const State& initial_state, const vector<Push>& pushes, const Puzzle& puzzle);
vector<State> replay_solution(const State& initial_state, const string& solution, const Puzzle& puzzle);

// Shortest walk between two squares without pushing anything (empty if start == end or unreachable)
vector<Direction> inner_path(const vector<Position>& boxes, const Position& start, const Position& end,
                             const Puzzle& puzzle);

// Expand a push solution into the full player path in LURD notation (lowercase = walk, uppercase = push)
string expand_solution(const State& initial_state, const vector<Push>& pushes, const Puzzle& puzzle);
string expand_solution(const State& initial_state, const string& solution, const Puzzle& puzzle);

#endif  // MOVES_HPP
