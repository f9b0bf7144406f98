#ifndef A_STAR_SOLVER_HPP
#define A_STAR_SOLVER_HPP

#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "heuristic.hpp"
#include "solver/base.hpp"

namespace AStar {

const size_t NO_PARENT = static_cast<size_t>(-1);

typedef vector<pair<Push, size_t>> History;      // ((current push), previous history index)
typedef unordered_map<State, uint32_t> BestCost;  // (state, lowest known push count)
typedef unordered_set<State> Closed;              // Finalized states

typedef struct Node {
    uint32_t cost;   // f = g + h
    uint32_t depth;  // g
    uint64_t order;  // Insertion counter, breaks ties FIFO
    State state;
    size_t history_idx;
} Node;

struct NodeCompare {
    bool operator()(const Node& a, const Node& b) const {
        if (a.cost != b.cost) return a.cost > b.cost;
        return a.order > b.order;
    }
};
typedef priority_queue<Node, vector<Node>, NodeCompare> PQueue;

class Solver : public BaseSolver {
   private:
    const GoalDistances distances;
    PQueue frontier;
    Closed closed;
    BestCost best_cost;
    // Store the push leading to each queued state
    History history;
    uint64_t counter = 0;

    void enqueue(const State& state, uint32_t depth, uint32_t heuristic, size_t history_idx);
    vector<Push> construct_solution(size_t history_idx) const;

   public:
    Solver(const Puzzle& puzzle, const State& initial_state, const SearchLimits& limits = SearchLimits());
    SolveResult solve() override;
};

}  // namespace AStar

#endif  // A_STAR_SOLVER_HPP
