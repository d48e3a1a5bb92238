#ifndef MOVE_GENERATOR_HPP
#define MOVE_GENERATOR_HPP

#include <array>
#include <string>
#include <utility>
#include <vector>

#include "Board.hpp"

// Direction the blank slides in
enum class Move {
    Up,
    Down,
    Left,
    Right
};

// Expansion order; search tie-breaking depends on it staying fixed
constexpr std::array<Move, 4> kMoveOrder = {Move::Up, Move::Down, Move::Left, Move::Right};

using Neighbor = std::pair<Move, Board>;

Move opposite(Move move);
std::string to_string(Move move);

// Legal successors of board, in kMoveOrder order (2 to 4 entries)
std::vector<Neighbor> neighbors(const Board& board);

// Slides the blank once; throws IllegalMoveError if it would leave the grid
Board apply_move(const Board& board, Move move);

// Replays a whole move sequence from board
Board apply_moves(const Board& board, const std::vector<Move>& moves);

#endif // MOVE_GENERATOR_HPP
