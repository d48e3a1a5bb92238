#ifndef BOARD_HPP
#define BOARD_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

#include "PuzzleErrors.hpp"

// Immutable 3x3 board. Labels are stored row-major, 0 is the blank.
class Board {
public:
    static constexpr int Rows = 3;
    static constexpr int Cols = 3;
    static constexpr int Size = Rows * Cols;
    using Tiles = std::array<int, Size>;

    // Validates the label sequence; throws InvalidBoardError on bad input
    explicit Board(const std::vector<int>& labels);
    Board(std::initializer_list<int> labels) : Board(std::vector<int>(labels)) {}
    explicit Board(const Tiles& tiles);

    Board(const Board& other) = default;
    Board& operator=(const Board& other) = default;

    // Canonical goal: 1..8 followed by the blank
    static Board goal();

    static constexpr int index(int row, int col) { return row * Cols + col; }
    static constexpr int row_of(int index) { return index / Cols; }
    static constexpr int col_of(int index) { return index % Cols; }

    int at(int row, int col) const { return tiles_[index(row, col)]; }
    int at(int index) const { return tiles_[index]; }
    const Tiles& tiles() const { return tiles_; }

    int blank_index() const { return blank_index_; }
    int blank_row() const { return row_of(blank_index_); }
    int blank_col() const { return col_of(blank_index_); }

    // Position (row-major index) holding the given label
    int position_of(int label) const;

    // New board with the labels at two positions exchanged; *this is left untouched
    Board swapped(int a, int b) const;

    bool operator==(const Board& other) const { return tiles_ == other.tiles_; }
    bool operator!=(const Board& other) const { return !(*this == other); }
    bool operator<(const Board& other) const { return tiles_ < other.tiles_; }

    std::string to_string() const;

private:
    Board(const Tiles& tiles, int blank_index) : tiles_(tiles), blank_index_(blank_index) {}

    Tiles tiles_;
    int blank_index_;
};

namespace std {
    template <>
    struct hash<Board> {
        size_t operator()(const Board& board) const {
            // hash_combine over the 9 labels
            size_t seed = Board::Size;
            for (int i : board.tiles()) {
                seed ^= static_cast<size_t>(i) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            }
            return seed;
        }
    };
}

#endif // BOARD_HPP
