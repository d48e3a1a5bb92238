#ifndef HEURISTIC_HPP
#define HEURISTIC_HPP

#include <array>

#include "Board.hpp"

// Manhattan distance to a fixed goal: for every label except the blank, the horizontal plus
// vertical distance between its current cell and its goal cell.
// Admissible and consistent: one slide moves one tile by one cell, so the estimate changes
// by exactly 1 per move.
class ManhattanHeuristic {
public:
    explicit ManhattanHeuristic(const Board& goal);

    int estimate(const Board& board) const;

    const Board& goal() const { return goal_; }

private:
    Board goal_;
    std::array<int, Board::Size> goal_row_{}; // indexed by label
    std::array<int, Board::Size> goal_col_{};
};

int manhattan_distance(const Board& board, const Board& goal);

#endif // HEURISTIC_HPP
