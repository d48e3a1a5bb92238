#include "Heuristic.hpp"

#include <cstdlib>

ManhattanHeuristic::ManhattanHeuristic(const Board& goal) : goal_(goal) {
    for (int i = 0; i < Board::Size; ++i) {
        int label = goal.at(i);
        goal_row_[label] = Board::row_of(i);
        goal_col_[label] = Board::col_of(i);
    }
}

int ManhattanHeuristic::estimate(const Board& board) const {
    int h = 0;
    for (int i = 0; i < Board::Size; ++i) {
        int val = board.at(i);
        if (val == 0) continue; // the blank does not count

        h += std::abs(Board::row_of(i) - goal_row_[val]) + std::abs(Board::col_of(i) - goal_col_[val]);
    }
    return h;
}

int manhattan_distance(const Board& board, const Board& goal) {
    return ManhattanHeuristic(goal).estimate(board);
}
