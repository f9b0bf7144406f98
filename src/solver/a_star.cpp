#include "solver/a_star.hpp"

#include <algorithm>
#include <iostream>

#include "moves.hpp"

using namespace std;
using namespace AStar;

AStar::Solver::Solver(const Puzzle& puzzle, const State& initial_state, const SearchLimits& limits)
    : BaseSolver(puzzle, initial_state, limits), distances(precompute_goal_distances(puzzle)) {}

void AStar::Solver::enqueue(const State& state, uint32_t depth, uint32_t heuristic, size_t history_idx) {
    frontier.push({depth + heuristic, depth, counter++, state, history_idx});
}

vector<Push> AStar::Solver::construct_solution(size_t history_idx) const {
    vector<Push> solution;
    for (size_t i = history_idx; i != NO_PARENT; i = history[i].second) solution.push_back(history[i].first);
    reverse(solution.begin(), solution.end());
    return solution;
}

SolveResult AStar::Solver::solve() {
    start_clock();
    states_explored = 0;
    if (puzzle.is_solved(initial_state)) return success({});  // Already solved

    uint32_t h = distance_heuristic(initial_state.boxes, distances);
    if (h == INF_DISTANCE) return failure(FailureReason::UNSOLVABLE, "No solution found: a box cannot reach any goal");
    if (puzzle.has_dead_box(initial_state))
        return failure(FailureReason::UNSOLVABLE, "No solution found: a box starts on a deadlock square");

#ifdef DEBUG
    size_t last_print = 0;
#endif

    best_cost[initial_state] = 0;
    enqueue(initial_state, 0, h, NO_PARENT);

    while (!frontier.empty()) {
        if (elapsed() > limits.timeout_seconds)
            return failure(FailureReason::TIMEOUT, "Search terminated: timeout reached");
        if (states_explored >= limits.max_states)
            return failure(FailureReason::TIMEOUT, "Search terminated: max states reached");

        Node node = frontier.top();
        frontier.pop();

        // Lazy deletion of entries superseded by a cheaper path
        if (closed.count(node.state)) continue;
        closed.insert(node.state);
        states_explored++;

#ifdef DEBUG
        if (states_explored >= last_print + 10000) {
            cerr << "Explored: " << states_explored << ", frontier: " << frontier.size() << endl;
            last_print = states_explored;
        }
#endif

        for (const auto& [push, new_state] : generate_moves(node.state, puzzle)) {
            if (closed.count(new_state)) continue;
            if (puzzle.has_dead_box(new_state)) continue;

            uint32_t new_depth = node.depth + 1;
            if (puzzle.is_solved(new_state)) {
                vector<Push> solution = construct_solution(node.history_idx);
                solution.push_back(push);
                return success(solution);
            }

            auto it = best_cost.find(new_state);
            if (it != best_cost.end() && it->second <= new_depth) continue;
            best_cost[new_state] = new_depth;

            uint32_t new_h = distance_heuristic(new_state.boxes, distances);
            if (new_h == INF_DISTANCE) continue;

            history.push_back({push, node.history_idx});
            enqueue(new_state, new_depth, new_h, history.size() - 1);
        }
    }

    return failure(FailureReason::UNSOLVABLE, "No solution exists");
}
