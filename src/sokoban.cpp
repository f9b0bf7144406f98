#include "sokoban.hpp"

#include <chrono>
#include <exception>

#include "parser.hpp"
#include "solver/a_star.hpp"

using namespace std;

SolveResult solve_puzzle(const string& puzzle_text, double timeout_seconds, size_t max_states) {
    auto start_time = chrono::steady_clock::now();

    try {
        LoadedPuzzle loaded = load_puzzle(puzzle_text);

        SearchLimits limits;
        limits.timeout_seconds = timeout_seconds;
        limits.max_states = max_states;

        AStar::Solver solver(loaded.puzzle, loaded.initial_state, limits);
        SolveResult result = solver.solve();
        // Include parsing and table construction in the reported time
        result.time_elapsed = chrono::duration<double>(chrono::steady_clock::now() - start_time).count();
        return result;
    } catch (const exception& e) {
        SolveResult result;
        result.success = false;
        result.reason = FailureReason::INVALID_PUZZLE;
        result.error = e.what();
        result.time_elapsed = chrono::duration<double>(chrono::steady_clock::now() - start_time).count();
        return result;
    }
}
