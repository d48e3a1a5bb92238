#include "Scrambler.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

#include "MoveGenerator.hpp"
#include "Solvability.hpp"

Scrambler::Scrambler(std::uint32_t seed, std::shared_ptr<spdlog::logger> logger)
    : rng_(seed), logger_(std::move(logger)) {
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }
}

Board Scrambler::shuffle_solvable(const Board& goal) {
    Board::Tiles tiles = goal.tiles();
    int attempts = 0;
    while (true) {
        ++attempts;
        std::shuffle(tiles.begin(), tiles.end(), rng_);
        Board candidate(tiles);
        if (is_solvable(candidate, goal)) {
            logger_->debug("Found solvable shuffle after {} attempt(s).", attempts);
            return candidate;
        }
    }
}

Board Scrambler::random_walk(const Board& goal, int steps) {
    if (steps < 0) {
        throw std::invalid_argument("random_walk needs a non-negative step count");
    }
    Board current = goal;
    bool has_last = false;
    Move last = Move::Up;
    for (int i = 0; i < steps; ++i) {
        std::vector<Neighbor> options;
        for (auto& neighbor : neighbors(current)) {
            if (has_last && neighbor.first == opposite(last)) continue;
            options.push_back(std::move(neighbor));
        }
        std::uniform_int_distribution<size_t> dist(0, options.size() - 1);
        const Neighbor& chosen = options[dist(rng_)];
        last = chosen.first;
        has_last = true;
        current = chosen.second;
    }
    return current;
}
