#ifndef BASE_SOLVER_HPP
#define BASE_SOLVER_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "game.hpp"

enum FailureReason {
    NONE = 0,
    INVALID_PUZZLE = 1,
    UNSOLVABLE = 2,
    TIMEOUT = 3,
};

inline const char* reason_to_str(const FailureReason& reason) {
    switch (reason) {
        case FailureReason::NONE:
            return "none";
        case FailureReason::INVALID_PUZZLE:
            return "invalid_puzzle";
        case FailureReason::UNSOLVABLE:
            return "unsolvable";
        case FailureReason::TIMEOUT:
            return "timeout";
        default:
            return "unknown";
    }
}

typedef struct SolveResult {
    bool success = false;
    string solution;      // One of UDLR per push
    vector<Push> pushes;  // The same pushes with the box each one moves
    FailureReason reason = FailureReason::NONE;
    string error;
    size_t states_explored = 0;
    double time_elapsed = 0.0;  // Seconds
    bool optimal = false;
} SolveResult;

typedef struct SearchLimits {
    double timeout_seconds = 60.0;
    size_t max_states = 10000000;
} SearchLimits;

class BaseSolver {
   protected:
    const Puzzle& puzzle;
    const State initial_state;
    const SearchLimits limits;
    chrono::steady_clock::time_point start_time;
    size_t states_explored = 0;

    void start_clock() { start_time = chrono::steady_clock::now(); }
    double elapsed() const { return chrono::duration<double>(chrono::steady_clock::now() - start_time).count(); }

    SolveResult success(const vector<Push>& pushes) const;
    SolveResult failure(FailureReason reason, const string& error) const;

   public:
    BaseSolver(const Puzzle& puzzle, const State& initial_state, const SearchLimits& limits)
        : puzzle(puzzle), initial_state(initial_state), limits(limits), start_time(chrono::steady_clock::now()) {}
    virtual ~BaseSolver() = default;
    virtual SolveResult solve() = 0;
};

#endif  // BASE_SOLVER_HPP
