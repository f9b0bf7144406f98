#include <gtest/gtest.h>

#include "moves.hpp"
#include "parser.hpp"

static const char* ONE_PUSH = "####\n#. #\n#$ #\n#@ #\n####";
static const char* TWO_PUSHES = "#####\n#.  #\n#   #\n#$  #\n#@  #\n#####";
static const char* DETOUR =
    "######\n"
    "#  @ #\n"
    "#  $ #\n"
    "# ## #\n"
    "#.   #\n"
    "######";
// The first box in row-major order can also move right but leaves the puzzle unsolved
static const char* TWO_CANDIDATES = "######\n#@*  #\n# $ .#\n######";

static size_t count_cells(const Map& map) {
    size_t count = 0;
    for (bool cell : map) count += cell;
    return count;
}

TEST(Reachable, BoxesBlockThePlayer) {
    LoadedPuzzle loaded = load_puzzle(ONE_PUSH);
    const Puzzle& puzzle = loaded.puzzle;
    Map reach = reachable(loaded.initial_state.player, loaded.initial_state.boxes, puzzle);

    EXPECT_EQ(count_cells(reach), 5u);
    EXPECT_TRUE(reach[puzzle.index(Position(1, 3))]);
    EXPECT_TRUE(reach[puzzle.index(Position(1, 1))]);
    EXPECT_FALSE(reach[puzzle.index(Position(1, 2))]);
    EXPECT_FALSE(reach[puzzle.index(Position(0, 0))]);
}

TEST(Reachable, SealedRoom) {
    LoadedPuzzle loaded = load_puzzle("#####\n#@#.#\n###$#\n#   #\n#####");
    Map reach = reachable(loaded.initial_state.player, loaded.initial_state.boxes, loaded.puzzle);
    EXPECT_EQ(count_cells(reach), 1u);
}

TEST(GenerateMoves, EnumeratesLegalPushesInOrder) {
    LoadedPuzzle loaded = load_puzzle(ONE_PUSH);
    vector<Successor> moves = generate_moves(loaded.initial_state, loaded.puzzle);

    ASSERT_EQ(moves.size(), 2u);
    EXPECT_EQ(moves[0].first.dir, Direction::UP);
    EXPECT_EQ(moves[0].first.from, Position(1, 2));
    EXPECT_EQ(moves[0].first.to, Position(1, 1));
    EXPECT_EQ(moves[0].second.player, Position(1, 2));
    EXPECT_EQ(moves[0].second.boxes, (vector<Position>{{1, 1}}));

    // The square the player stands on is not an obstacle for the box
    EXPECT_EQ(moves[1].first.dir, Direction::DOWN);
    EXPECT_EQ(moves[1].second.boxes, (vector<Position>{{1, 3}}));
}

TEST(GenerateMoves, BoxesBlockEachOther) {
    LoadedPuzzle loaded = load_puzzle("######\n#@$$.#\n#   .#\n######");
    vector<Successor> moves = generate_moves(loaded.initial_state, loaded.puzzle);

    for (const auto& [push, state] : moves) {
        EXPECT_FALSE(push.from == Position(2, 1) && push.dir == Direction::RIGHT);
        EXPECT_EQ(state.boxes.size(), 2u);
    }
}

TEST(ApplyMove, PushesTheBox) {
    LoadedPuzzle loaded = load_puzzle(ONE_PUSH);
    State next = apply_move(loaded.initial_state, Direction::UP, loaded.puzzle);

    EXPECT_EQ(next.player, Position(1, 2));
    EXPECT_TRUE(loaded.puzzle.is_solved(next));
}

TEST(ApplyMove, IllegalPushThrows) {
    LoadedPuzzle loaded = load_puzzle(ONE_PUSH);
    EXPECT_THROW(apply_move(loaded.initial_state, Direction::LEFT, loaded.puzzle), IllegalReplay);
    EXPECT_THROW(apply_move(loaded.initial_state, Direction::RIGHT, loaded.puzzle), IllegalReplay);
}

TEST(ReplaySolution, ReachesTheGoal) {
    LoadedPuzzle loaded = load_puzzle(TWO_PUSHES);
    vector<State> states = replay_solution(loaded.initial_state, "UU", loaded.puzzle);

    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states.front(), loaded.initial_state);
    EXPECT_EQ(states[1].boxes, (vector<Position>{{1, 2}}));
    EXPECT_TRUE(loaded.puzzle.is_solved(states.back()));
}

TEST(ReplaySolution, RejectsCorruptedSolutions) {
    LoadedPuzzle loaded = load_puzzle(TWO_PUSHES);
    EXPECT_THROW(replay_solution(loaded.initial_state, "UX", loaded.puzzle), IllegalReplay);
    EXPECT_THROW(replay_solution(loaded.initial_state, "UUU", loaded.puzzle), IllegalReplay);
}

TEST(InnerPath, WalksAroundObstacles) {
    LoadedPuzzle loaded = load_puzzle(DETOUR);
    const State& state = loaded.initial_state;

    vector<Direction> path = inner_path(state.boxes, state.player, Position(4, 2), loaded.puzzle);
    EXPECT_EQ(path, (vector<Direction>{Direction::RIGHT, Direction::DOWN}));

    EXPECT_TRUE(inner_path(state.boxes, state.player, state.player, loaded.puzzle).empty());
    // Box squares cannot be walked onto
    EXPECT_TRUE(inner_path(state.boxes, state.player, Position(3, 2), loaded.puzzle).empty());
}

TEST(ExpandSolution, InsertsWalkingSteps) {
    LoadedPuzzle loaded = load_puzzle(DETOUR);
    EXPECT_EQ(expand_solution(loaded.initial_state, "LLDD", loaded.puzzle), "rdLLulDD");

    LoadedPuzzle direct = load_puzzle(TWO_PUSHES);
    EXPECT_EQ(expand_solution(direct.initial_state, "UU", direct.puzzle), "UU");
}

TEST(ApplyPush, MovesTheNamedBox) {
    LoadedPuzzle loaded = load_puzzle(TWO_CANDIDATES);
    State next = apply_push(loaded.initial_state, Push{Direction::RIGHT, {2, 2}, {3, 2}}, loaded.puzzle);

    EXPECT_EQ(next.player, Position(2, 2));
    EXPECT_EQ(next.boxes, (vector<Position>{{2, 1}, {3, 2}}));
}

TEST(ApplyPush, IllegalPushThrows) {
    LoadedPuzzle loaded = load_puzzle(TWO_CANDIDATES);
    const State& state = loaded.initial_state;
    // No box there
    EXPECT_THROW(apply_push(state, Push{Direction::RIGHT, {3, 1}, {4, 1}}, loaded.puzzle), IllegalReplay);
    // Player cannot reach the square above the box
    EXPECT_THROW(apply_push(state, Push{Direction::DOWN, {2, 1}, {2, 2}}, loaded.puzzle), IllegalReplay);
    // Destination does not match the direction
    EXPECT_THROW(apply_push(state, Push{Direction::RIGHT, {2, 2}, {2, 3}}, loaded.puzzle), IllegalReplay);
}

TEST(ReplaySolution, TriesEveryBoxForALetter) {
    LoadedPuzzle loaded = load_puzzle(TWO_CANDIDATES);
    vector<Push> pushes = resolve_pushes(loaded.initial_state, "RR", loaded.puzzle);

    ASSERT_EQ(pushes.size(), 2u);
    EXPECT_EQ(pushes[0].from, Position(2, 2));
    EXPECT_EQ(pushes[1].from, Position(3, 2));

    vector<State> states = replay_solution(loaded.initial_state, "RR", loaded.puzzle);
    ASSERT_EQ(states.size(), 3u);
    EXPECT_TRUE(loaded.puzzle.is_solved(states.back()));
    EXPECT_EQ(states, replay_pushes(loaded.initial_state, pushes, loaded.puzzle));
}

TEST(ReplaySolution, RejectsStringsThatEndUnsolved) {
    LoadedPuzzle loaded = load_puzzle(TWO_CANDIDATES);
    EXPECT_THROW(replay_solution(loaded.initial_state, "R", loaded.puzzle), IllegalReplay);
    EXPECT_THROW(replay_solution(loaded.initial_state, "", loaded.puzzle), IllegalReplay);
}

TEST(ExpandSolution, WalksToTheBoxThatIsPushed) {
    LoadedPuzzle loaded = load_puzzle(TWO_CANDIDATES);
    EXPECT_EQ(expand_solution(loaded.initial_state, "RR", loaded.puzzle), "dRR");

    vector<Push> pushes = {{Direction::RIGHT, {2, 2}, {3, 2}}, {Direction::RIGHT, {3, 2}, {4, 2}}};
    EXPECT_EQ(expand_solution(loaded.initial_state, pushes, loaded.puzzle), "dRR");
}
