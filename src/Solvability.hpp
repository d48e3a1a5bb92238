#ifndef SOLVABILITY_HPP
#define SOLVABILITY_HPP

#include "Board.hpp"

// Number of pairs (i < j) of non-blank labels in row-major order with label[i] > label[j]
int count_inversions(const Board& board);

// True iff board can reach goal by sliding the blank.
// On a 3-wide grid a slide never changes inversion parity, so the two boards must have
// equal parity (for the canonical goal: an even inversion count).
bool is_solvable(const Board& board, const Board& goal = Board::goal());

#endif // SOLVABILITY_HPP
