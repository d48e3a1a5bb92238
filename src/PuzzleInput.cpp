#include "PuzzleInput.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

PuzzleInput read_puzzle(std::istream& in) {
    int N, M;
    if (!(in >> N >> M)) {
        throw std::runtime_error("Could not read N and M from puzzle input");
    }
    if (N != Board::Rows || M != Board::Cols) {
        throw InvalidBoardError("Invalid board dimensions N=" + std::to_string(N) + " M=" + std::to_string(M) +
                                "; only 3x3 boards are supported");
    }

    std::vector<int> start_tiles(Board::Size);
    for (int i = 0; i < Board::Size; ++i) {
        if (!(in >> start_tiles[i])) {
            throw std::runtime_error("Could not read all start tiles from puzzle input");
        }
    }

    // Goal labels are optional, but if present there must be all nine
    std::vector<int> goal_tiles;
    int label;
    while (in >> label) {
        goal_tiles.push_back(label);
    }
    if (!in.eof()) {
        throw std::runtime_error("Unexpected non-numeric data in puzzle input");
    }

    Board start(start_tiles);
    if (goal_tiles.empty()) {
        return PuzzleInput{start, Board::goal()};
    }
    return PuzzleInput{start, Board(goal_tiles)};
}

PuzzleInput read_puzzle_file(const std::string& filename) {
    std::ifstream input_file(filename);
    if (!input_file.is_open()) {
        throw std::runtime_error("Could not open input file: " + filename);
    }
    return read_puzzle(input_file);
}
