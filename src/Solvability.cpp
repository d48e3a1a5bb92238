#include "Solvability.hpp"

int count_inversions(const Board& board) {
    int inversions = 0;
    for (int i = 0; i < Board::Size; ++i) {
        int a = board.at(i);
        if (a == 0) continue;
        for (int j = i + 1; j < Board::Size; ++j) {
            int b = board.at(j);
            if (b != 0 && a > b) ++inversions;
        }
    }
    return inversions;
}

bool is_solvable(const Board& board, const Board& goal) {
    return count_inversions(board) % 2 == count_inversions(goal) % 2;
}
