#ifndef PUZZLE_INPUT_HPP
#define PUZZLE_INPUT_HPP

#include <istream>
#include <string>

#include "Board.hpp"

// Start and goal boards read from a puzzle file
struct PuzzleInput {
    Board start;
    Board goal;
};

// Plain-text format: "N M" (must be "3 3"), nine start labels, then optionally nine goal
// labels. Without goal labels the canonical goal is used.
// Throws std::runtime_error on unreadable input and InvalidBoardError on a bad board.
PuzzleInput read_puzzle(std::istream& in);
PuzzleInput read_puzzle_file(const std::string& filename);

#endif // PUZZLE_INPUT_HPP
