#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "cli.hpp"
#include "moves.hpp"
#include "parser.hpp"
#include "render.hpp"
#include "sokoban.hpp"

using namespace std;

static const char* dir_name(char move) {
    switch (move) {
        case 'U':
            return "Up";
        case 'D':
            return "Down";
        case 'L':
            return "Left";
        case 'R':
            return "Right";
        default:
            return "?";
    }
}

static void playback_solution(const string& puzzle_text, const vector<Push>& pushes, double delay) {
    LoadedPuzzle loaded = load_puzzle(puzzle_text);
    const Puzzle& puzzle = loaded.puzzle;
    auto pause = chrono::duration<double>(delay);

    State state = loaded.initial_state;
    cout << "Initial state:" << endl << state_to_string(state, puzzle) << endl << endl;
    this_thread::sleep_for(pause);

    for (size_t i = 0; i < pushes.size(); i++) {
        state = apply_push(state, pushes[i], puzzle);

        cout << "\033[2J\033[H";  // Clear the terminal
        cout << "Move " << i + 1 << "/" << pushes.size() << ": " << dir_to_str(pushes[i].dir) << endl;
        cout << state_to_string(state, puzzle) << endl << endl;
        this_thread::sleep_for(pause);
    }

    cout << "Solution complete!" << endl;
}

int main(int argc, char* argv[]) {
    Options options;
    if (!parse_args(argc, argv, options)) {
        print_usage(argv[0]);
        return 1;
    }

    ifstream file(options.puzzle_file);
    if (!file.is_open()) {
        cerr << "Error: File '" << options.puzzle_file << "' not found." << endl;
        return 1;
    }
    stringstream buffer;
    buffer << file.rdbuf();
    string puzzle_text = buffer.str();
    file.close();

    cout << "Puzzle: " << options.puzzle_file << endl;
    if (options.verbose) cout << "Puzzle contents:" << endl << puzzle_text << endl << endl;

    SolveResult result = solve_puzzle(puzzle_text, options.timeout, options.max_states);

    if (!result.success) {
        cout << "No solution found." << endl << endl;
        cout << "Statistics:" << endl;
        cout << "  States explored: " << result.states_explored << endl;
        cout << "  Time elapsed: " << fixed << setprecision(2) << result.time_elapsed << " seconds" << endl;
        cout << "  Termination reason: " << reason_to_str(result.reason) << endl;
        if (!result.error.empty()) cout << "  Error: " << result.error << endl;
        return 1;
    }

    cout << "Solution found in " << result.solution.size() << " pushes!" << endl << endl;
    cout << "Solution: " << result.solution << endl << endl;
    cout << "Statistics:" << endl;
    cout << "  States explored: " << result.states_explored << endl;
    cout << "  Time elapsed: " << fixed << setprecision(2) << result.time_elapsed << " seconds" << endl;
    cout << "  Solution length: " << result.solution.size() << " pushes" << endl;
    cout << "  Optimality: Guaranteed (A*)" << endl;

    if (options.verbose) {
        cout << endl << "Move sequence:" << endl;
        for (size_t i = 0; i < result.solution.size(); i++)
            cout << "  " << i + 1 << ". " << result.solution[i] << " (" << dir_name(result.solution[i]) << ")" << endl;
    }

    try {
        if (options.lurd) {
            LoadedPuzzle loaded = load_puzzle(puzzle_text);
            cout << endl
                 << "Player path: " << expand_solution(loaded.initial_state, result.pushes, loaded.puzzle) << endl;
        }
        if (options.visualize) {
            cout << endl << "Playback:" << endl;
            playback_solution(puzzle_text, result.pushes, options.delay);
        }
    } catch (const runtime_error& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
