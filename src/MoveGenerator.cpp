#include "MoveGenerator.hpp"

namespace {

// Row/column offset of the blank for each direction: up, down, left, right
constexpr int dr[] = {-1, 1, 0, 0};
constexpr int dc[] = {0, 0, -1, 1};

int direction_index(Move move) {
    return static_cast<int>(move);
}

// Index the blank lands on, or -1 if it leaves the grid
int target_index(const Board& board, Move move) {
    int new_row = board.blank_row() + dr[direction_index(move)];
    int new_col = board.blank_col() + dc[direction_index(move)];
    if (new_row < 0 || new_row >= Board::Rows || new_col < 0 || new_col >= Board::Cols) {
        return -1;
    }
    return Board::index(new_row, new_col);
}

} // namespace

Move opposite(Move move) {
    switch (move) {
        case Move::Up: return Move::Down;
        case Move::Down: return Move::Up;
        case Move::Left: return Move::Right;
        case Move::Right: return Move::Left;
    }
    return move;
}

std::string to_string(Move move) {
    switch (move) {
        case Move::Up: return "Up";
        case Move::Down: return "Down";
        case Move::Left: return "Left";
        case Move::Right: return "Right";
    }
    return "?";
}

std::vector<Neighbor> neighbors(const Board& board) {
    std::vector<Neighbor> result;
    result.reserve(kMoveOrder.size());
    for (Move move : kMoveOrder) {
        int target = target_index(board, move);
        if (target < 0) continue;
        result.emplace_back(move, board.swapped(board.blank_index(), target));
    }
    return result;
}

Board apply_move(const Board& board, Move move) {
    int target = target_index(board, move);
    if (target < 0) {
        throw IllegalMoveError("Cannot move blank " + to_string(move) + " from (" + std::to_string(board.blank_row()) +
                               "," + std::to_string(board.blank_col()) + ")");
    }
    return board.swapped(board.blank_index(), target);
}

Board apply_moves(const Board& board, const std::vector<Move>& moves) {
    Board current = board;
    for (Move move : moves) {
        current = apply_move(current, move);
    }
    return current;
}
