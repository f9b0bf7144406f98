#ifndef DEADLOCK_HPP
#define DEADLOCK_HPP

#include <vector>

#include "game.hpp"

// A non-goal square with two walls meeting at a right angle. A box pushed there can never leave.
bool is_corner_deadlock(const Position& pos, const Puzzle& puzzle);

// Every non-wall, non-goal corner square of the grid
vector<Position> compute_static_deadlocks(const Puzzle& puzzle);

// A box off its goal that cannot be pushed in any direction given the current boxes
bool is_freeze_deadlock(const vector<Position>& boxes, const Puzzle& puzzle);

// Four boxes filling a 2x2 block that is not entirely made of goals
bool is_2x2_deadlock(const vector<Position>& boxes, const Puzzle& puzzle);

bool is_deadlocked(const State& state, const Puzzle& puzzle);

#endif  // DEADLOCK_HPP
