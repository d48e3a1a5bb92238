#ifndef SCRAMBLER_HPP
#define SCRAMBLER_HPP

#include <cstdint>
#include <memory>
#include <random>

#include <spdlog/spdlog.h>

#include "Board.hpp"

// Produces solvable start boards for a given goal
class Scrambler {
public:
    explicit Scrambler(std::uint32_t seed, std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    // Shuffles the goal's labels until the permutation is solvable for that goal.
    // The result may equal the goal.
    Board shuffle_solvable(const Board& goal = Board::goal());

    // Applies `steps` random blank moves to goal, never undoing the previous move
    Board random_walk(const Board& goal, int steps);

private:
    std::mt19937 rng_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // SCRAMBLER_HPP
