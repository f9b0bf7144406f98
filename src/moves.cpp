#include "moves.hpp"

#include <algorithm>
#include <cctype>
#include <queue>
#include <unordered_set>

using namespace std;

Map reachable(const Position& player, const vector<Position>& boxes, const Puzzle& puzzle) {
    Map blocked = puzzle.walls;
    for (const Position& box : boxes) blocked[puzzle.index(box)] = true;

    Map visited(puzzle.size(), false);
    if (!puzzle.pos_valid(player)) return visited;

    queue<Position> q;
    q.push(player);
    visited[puzzle.index(player)] = true;

    while (!q.empty()) {
        Position curr = q.front();
        q.pop();

        for (Direction d : DIRECTIONS) {
            Position next = curr + d;
            if (!puzzle.pos_valid(next)) continue;

            size_t idx = puzzle.index(next);
            if (!visited[idx] && !blocked[idx]) {
                visited[idx] = true;
                q.push(next);
            }
        }
    }

    return visited;
}

static bool push_allowed(const State& state, const Map& reach, const Position& box, const Direction& dir,
                         const Puzzle& puzzle) {
    Position player_pos = box - dir;
    Position new_box = box + dir;

    if (!puzzle.pos_valid(player_pos) || !reach[puzzle.index(player_pos)]) return false;
    if (!puzzle.pos_valid(new_box) || puzzle.is_wall(new_box) || state.has_box(new_box)) return false;
    return true;
}

vector<Successor> generate_moves(const State& state, const Puzzle& puzzle) {
    Map reach = reachable(state.player, state.boxes, puzzle);
    vector<Successor> moves;

    for (const Position& box : state.boxes) {
        for (Direction dir : DIRECTIONS) {  // The push direction
            if (!push_allowed(state, reach, box, dir, puzzle)) continue;
            moves.push_back(Successor(Push{dir, box, box + dir}, state.push(box, dir)));
        }
    }

    return moves;
}

State apply_move(const State& state, const Direction& dir, const Puzzle& puzzle) {
    Map reach = reachable(state.player, state.boxes, puzzle);
    for (const Position& box : state.boxes) {
        if (push_allowed(state, reach, box, dir, puzzle)) return state.push(box, dir);
    }
    throw IllegalReplay(string("No valid ") + dir_to_str(dir) + " push from the current state");
}

State apply_push(const State& state, const Push& push, const Puzzle& puzzle) {
    Map reach = reachable(state.player, state.boxes, puzzle);
    if (!state.has_box(push.from) || push.to != push.from + push.dir ||
        !push_allowed(state, reach, push.from, push.dir, puzzle))
        throw IllegalReplay(string("Box cannot be pushed ") + dir_to_str(push.dir) + " from the current state");
    return state.push(push.from, push.dir);
}

// Depth-first over every box that can take the next letter. failed[i] holds states known not to finish from step i.
static bool resolve_from(const State& state, const vector<Direction>& dirs, size_t step, const Puzzle& puzzle,
                         vector<unordered_set<State>>& failed, vector<Push>& pushes) {
    if (step == dirs.size()) return puzzle.is_solved(state);
    if (failed[step].count(state)) return false;

    Direction dir = dirs[step];
    Map reach = reachable(state.player, state.boxes, puzzle);
    for (const Position& box : state.boxes) {
        if (!push_allowed(state, reach, box, dir, puzzle)) continue;

        pushes.push_back({dir, box, box + dir});
        if (resolve_from(state.push(box, dir), dirs, step + 1, puzzle, failed, pushes)) return true;
        pushes.pop_back();
    }

    failed[step].insert(state);
    return false;
}

vector<Push> resolve_pushes(const State& initial_state, const string& solution, const Puzzle& puzzle) {
    vector<Direction> dirs;
    for (char c : solution) {
        Direction dir;
        if (!str_to_dir(c, dir)) throw IllegalReplay(string("Unknown move '") + c + "' in solution");
        dirs.push_back(dir);
    }

    vector<unordered_set<State>> failed(dirs.size());
    vector<Push> pushes;
    if (!resolve_from(initial_state, dirs, 0, puzzle, failed, pushes))
        throw IllegalReplay("Solution '" + solution + "' does not solve the puzzle");
    return pushes;
}

vector<State> replay_pushes(const State& initial_state, const vector<Push>& pushes, const Puzzle& puzzle) {
    vector<State> states = {initial_state};
    for (const Push& push : pushes) states.push_back(apply_push(states.back(), push, puzzle));
    return states;
}

vector<State> replay_solution(const State& initial_state, const string& solution, const Puzzle& puzzle) {
    return replay_pushes(initial_state, resolve_pushes(initial_state, solution, puzzle), puzzle);
}

// Find a path from start to end within the player's connected component (simple BFS)
vector<Direction> inner_path(const vector<Position>& boxes, const Position& start, const Position& end,
                             const Puzzle& puzzle) {
    vector<Direction> path;
    if (!puzzle.pos_valid(start) || !puzzle.pos_valid(end)) return path;

    Map visited = puzzle.walls;  // Prevent walking into walls or boxes
    for (const Position& box : boxes) visited[puzzle.index(box)] = true;
    vector<Direction> from(puzzle.size(), Direction::UP);

    queue<Position> q;
    q.push(start);
    visited[puzzle.index(start)] = true;

    while (!q.empty()) {
        Position curr = q.front();
        q.pop();

        if (curr == end) {
            // Backtrack to find the path
            Position p = end;
            while (p != start) {
                Direction d = from[puzzle.index(p)];
                path.push_back(d);
                p = p - d;
            }
            break;
        }
        for (Direction d : DIRECTIONS) {
            Position next = curr + d;
            if (!puzzle.pos_valid(next)) continue;

            if (!visited[puzzle.index(next)]) {
                visited[puzzle.index(next)] = true;
                from[puzzle.index(next)] = d;
                q.push(next);
            }
        }
    }

    reverse(path.begin(), path.end());
    return path;
}

string expand_solution(const State& initial_state, const vector<Push>& pushes, const Puzzle& puzzle) {
    string full_path;

    State state = initial_state;
    for (const Push& push : pushes) {
        State next = apply_push(state, push, puzzle);

        // Walk to the pushing position, then push
        Position push_pos = push.from - push.dir;
        for (Direction step : inner_path(state.boxes, state.player, push_pos, puzzle))
            full_path += static_cast<char>(tolower(dir_to_str(step)));
        full_path += dir_to_str(push.dir);

        state = next;
    }

    return full_path;
}

string expand_solution(const State& initial_state, const string& solution, const Puzzle& puzzle) {
    return expand_solution(initial_state, resolve_pushes(initial_state, solution, puzzle), puzzle);
}
