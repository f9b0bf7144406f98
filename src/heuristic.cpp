#include "heuristic.hpp"

#include <algorithm>
#include <queue>

using namespace std;

GoalDistances::GoalDistances(size_t width, vector<vector<uint32_t>> table) : width(width), table(move(table)) {
    size_t cells = this->table.empty() ? 0 : this->table[0].size();
    nearest_table.assign(cells, INF_DISTANCE);
    for (const vector<uint32_t>& goal_table : this->table) {
        for (size_t i = 0; i < cells; ++i) nearest_table[i] = min(nearest_table[i], goal_table[i]);
    }
}

uint32_t GoalDistances::at(const Position& pos, size_t goal_idx) const {
    if (goal_idx >= table.size() || pos.x < 0 || pos.y < 0 || static_cast<size_t>(pos.x) >= width)
        return INF_DISTANCE;
    size_t idx = static_cast<size_t>(pos.y) * width + pos.x;
    if (idx >= table[goal_idx].size()) return INF_DISTANCE;
    return table[goal_idx][idx];
}

uint32_t GoalDistances::nearest(const Position& pos) const {
    if (pos.x < 0 || pos.y < 0 || static_cast<size_t>(pos.x) >= width) return INF_DISTANCE;
    size_t idx = static_cast<size_t>(pos.y) * width + pos.x;
    if (idx >= nearest_table.size()) return INF_DISTANCE;
    return nearest_table[idx];
}

GoalDistances precompute_goal_distances(const Puzzle& puzzle) {
    vector<vector<uint32_t>> table;

    for (const Position& goal : puzzle.goals) {
        vector<uint32_t> dist(puzzle.size(), INF_DISTANCE);

        queue<Position> q;
        q.push(goal);
        dist[puzzle.index(goal)] = 0;

        while (!q.empty()) {
            Position curr = q.front();
            q.pop();
            uint32_t next_dist = dist[puzzle.index(curr)] + 1;

            for (Direction d : DIRECTIONS) {
                Position next = curr + d;
                if (!puzzle.pos_valid(next) || puzzle.is_wall(next)) continue;

                size_t idx = puzzle.index(next);
                if (dist[idx] == INF_DISTANCE) {
                    dist[idx] = next_dist;
                    q.push(next);
                }
            }
        }

        table.push_back(move(dist));
    }

    return GoalDistances(puzzle.width, move(table));
}

uint32_t distance_heuristic(const vector<Position>& boxes, const GoalDistances& distances) {
    uint32_t h = 0;
    for (const Position& box : boxes) {
        uint32_t min_dist = distances.nearest(box);
        if (min_dist == INF_DISTANCE) return INF_DISTANCE;
        h += min_dist;
    }
    return h;
}
