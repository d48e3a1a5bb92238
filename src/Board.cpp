#include "Board.hpp"

#include <algorithm>
#include <utility>

namespace {

// Checks that labels is a permutation of 0..Size-1 and returns the blank's index
int validate_labels(const std::vector<int>& labels) {
    if (labels.size() != static_cast<size_t>(Board::Size)) {
        throw InvalidBoardError("Board needs exactly " + std::to_string(Board::Size) + " labels, got " +
                                std::to_string(labels.size()));
    }
    std::array<bool, Board::Size> seen{};
    int blank = -1;
    for (int i = 0; i < Board::Size; ++i) {
        int label = labels[i];
        if (label < 0 || label >= Board::Size) {
            throw InvalidBoardError("Label " + std::to_string(label) + " at position " + std::to_string(i) +
                                    " is outside [0," + std::to_string(Board::Size - 1) + "]");
        }
        if (seen[label]) {
            throw InvalidBoardError("Duplicate label " + std::to_string(label));
        }
        seen[label] = true;
        if (label == 0) blank = i;
    }
    // With Size labels in range and no duplicates every label is present, blank included
    return blank;
}

} // namespace

Board::Board(const std::vector<int>& labels) {
    blank_index_ = validate_labels(labels);
    std::copy(labels.begin(), labels.end(), tiles_.begin());
}

Board::Board(const Tiles& tiles) : Board(std::vector<int>(tiles.begin(), tiles.end())) {}

Board Board::goal() {
    Tiles tiles{};
    for (int i = 0; i < Size - 1; ++i) {
        tiles[i] = i + 1;
    }
    tiles[Size - 1] = 0;
    return Board(tiles, Size - 1);
}

int Board::position_of(int label) const {
    for (int i = 0; i < Size; ++i) {
        if (tiles_[i] == label) return i;
    }
    throw InvalidBoardError("Label " + std::to_string(label) + " is not on the board");
}

Board Board::swapped(int a, int b) const {
    if (a < 0 || a >= Size || b < 0 || b >= Size) {
        throw InvalidBoardError("Swap positions " + std::to_string(a) + "," + std::to_string(b) + " out of range");
    }
    Tiles tiles = tiles_;
    std::swap(tiles[a], tiles[b]);
    int blank = blank_index_;
    if (blank == a) {
        blank = b;
    } else if (blank == b) {
        blank = a;
    }
    return Board(tiles, blank);
}

std::string Board::to_string() const {
    std::string s;
    for (int r = 0; r < Rows; ++r) {
        for (int c = 0; c < Cols; ++c) {
            int val = at(r, c);
            s += (val == 0 ? " " : std::to_string(val));
            if (c + 1 < Cols) s += " ";
        }
        s += "\n";
    }
    return s;
}
