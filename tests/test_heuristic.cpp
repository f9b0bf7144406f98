#include <gtest/gtest.h>

#include "heuristic.hpp"
#include "parser.hpp"

static const char* TWO_PUSHES = "#####\n#.  #\n#   #\n#$  #\n#@  #\n#####";

TEST(GoalDistances, BreadthFirstFromEachGoal) {
    LoadedPuzzle loaded = load_puzzle(TWO_PUSHES);
    GoalDistances distances = precompute_goal_distances(loaded.puzzle);

    ASSERT_EQ(distances.num_goals(), 1u);
    EXPECT_EQ(distances.at(Position(1, 1), 0), 0u);
    EXPECT_EQ(distances.at(Position(1, 3), 0), 2u);
    EXPECT_EQ(distances.at(Position(3, 4), 0), 5u);
    EXPECT_EQ(distances.at(Position(0, 0), 0), INF_DISTANCE);  // Wall
    EXPECT_EQ(distances.at(Position(1, 1), 1), INF_DISTANCE);  // No such goal
}

TEST(GoalDistances, WallsForceDetours) {
    LoadedPuzzle loaded = load_puzzle("######\n#.   #\n# ## #\n#  $ #\n#  @ #\n######");
    GoalDistances distances = precompute_goal_distances(loaded.puzzle);
    EXPECT_EQ(distances.at(Position(3, 3), 0), 4u);
    EXPECT_EQ(distances.nearest(Position(3, 3)), 4u);
}

TEST(DistanceHeuristic, SumsNearestGoals) {
    LoadedPuzzle loaded = load_puzzle("#######\n#.   .#\n#     #\n# $ $ #\n#  @  #\n#######");
    GoalDistances distances = precompute_goal_distances(loaded.puzzle);

    // Both boxes are three squares from their nearest goal
    EXPECT_EQ(distance_heuristic(loaded.initial_state.boxes, distances), 6u);
    EXPECT_EQ(distance_heuristic({{1, 1}, {5, 1}}, distances), 0u);
}

TEST(DistanceHeuristic, WalledOffBoxIsInfinite) {
    LoadedPuzzle loaded = load_puzzle(
        "#######\n"
        "#@$ # #\n"
        "#.  #$#\n"
        "#.  # #\n"
        "#######");
    GoalDistances distances = precompute_goal_distances(loaded.puzzle);
    EXPECT_EQ(distances.nearest(Position(5, 2)), INF_DISTANCE);
    EXPECT_EQ(distance_heuristic(loaded.initial_state.boxes, distances), INF_DISTANCE);
}

TEST(DistanceHeuristic, NeverOverestimates) {
    LoadedPuzzle loaded = load_puzzle(TWO_PUSHES);
    GoalDistances distances = precompute_goal_distances(loaded.puzzle);
    EXPECT_LE(distance_heuristic(loaded.initial_state.boxes, distances), 2u);
}
