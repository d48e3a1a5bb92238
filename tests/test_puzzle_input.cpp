// Google Test for reading puzzle files
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

#include "PuzzleInput.hpp"

TEST(PuzzleInput, StartOnlyUsesCanonicalGoal) {
    std::istringstream in("3 3\n1 2 3\n4 0 6\n7 5 8\n");
    PuzzleInput input = read_puzzle(in);
    EXPECT_EQ(input.start, (Board{1, 2, 3, 4, 0, 6, 7, 5, 8}));
    EXPECT_EQ(input.goal, Board::goal());
}

TEST(PuzzleInput, ExplicitGoal) {
    std::istringstream in("3 3\n1 2 0 3 4 5 6 7 8\n0 1 2 3 4 5 6 7 8\n");
    PuzzleInput input = read_puzzle(in);
    EXPECT_EQ(input.start, (Board{1, 2, 0, 3, 4, 5, 6, 7, 8}));
    EXPECT_EQ(input.goal, (Board{0, 1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST(PuzzleInput, WrongDimensionsThrow) {
    std::istringstream in("4 4\n1 2 3 4 5 6 7 8 9 10 11 12 13 14 15 0\n");
    EXPECT_THROW(read_puzzle(in), InvalidBoardError);
}

TEST(PuzzleInput, MissingTilesThrow) {
    std::istringstream in("3 3\n1 2 3 4 0\n");
    EXPECT_THROW(read_puzzle(in), std::runtime_error);

    std::istringstream empty("");
    EXPECT_THROW(read_puzzle(empty), std::runtime_error);
}

TEST(PuzzleInput, BadBoardsThrow) {
    std::istringstream dup("3 3\n1 2 3 4 5 6 3 8 0\n");
    EXPECT_THROW(read_puzzle(dup), InvalidBoardError);

    std::istringstream short_goal("3 3\n1 2 3 4 5 6 7 8 0\n1 2 3\n");
    EXPECT_THROW(read_puzzle(short_goal), InvalidBoardError);
}

TEST(PuzzleInput, GarbageAfterBoardThrows) {
    std::istringstream in("3 3\n1 2 3 4 5 6 7 8 0\nabc\n");
    EXPECT_THROW(read_puzzle(in), std::runtime_error);
}

TEST(PuzzleInput, MissingFileThrows) {
    EXPECT_THROW(read_puzzle_file("/nonexistent/puzzle.txt"), std::runtime_error);
}
