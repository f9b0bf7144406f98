#ifndef HEURISTIC_HPP
#define HEURISTIC_HPP

#include <cstdint>
#include <vector>

#include "game.hpp"

const uint32_t INF_DISTANCE = UINT32_MAX;

// Distance from every square to every goal, walls respected and boxes ignored
class GoalDistances {
   private:
    size_t width;
    vector<vector<uint32_t>> table;  // table[goal_idx][cell index]
    vector<uint32_t> nearest_table;  // Minimum over all goals per cell

   public:
    GoalDistances() : width(0) {}
    GoalDistances(size_t width, vector<vector<uint32_t>> table);

    size_t num_goals() const { return table.size(); }
    uint32_t at(const Position& pos, size_t goal_idx) const;
    uint32_t nearest(const Position& pos) const;
};

// One BFS outward from each goal of puzzle.goals, in order
GoalDistances precompute_goal_distances(const Puzzle& puzzle);

// Sum of each box's distance to its nearest goal, or INF_DISTANCE if some box reaches no goal
uint32_t distance_heuristic(const vector<Position>& boxes, const GoalDistances& distances);

#endif  // HEURISTIC_HPP
