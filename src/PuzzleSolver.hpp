// PuzzleSolver.hpp
#ifndef PUZZLE_SOLVER_HPP
#define PUZZLE_SOLVER_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "Board.hpp"
#include "MoveGenerator.hpp"
#include "PuzzleErrors.hpp"

// Limits for a single solve call. Zero means unlimited.
struct SolveOptions {
    std::size_t max_expansions = 0;
    std::chrono::milliseconds time_limit{0};
};

// Optimal solution found by the solver
struct Solution {
    int cost = 0;               // number of moves
    std::vector<Move> moves;    // blank moves, start to goal
    std::vector<Board> path;    // boards from start to goal inclusive (cost + 1 entries)
    std::size_t nodes_expanded = 0;
    std::size_t nodes_generated = 0;
};

// A* solver for the 8-puzzle with unit move cost and Manhattan distance.
//
// Every call to solve() owns its own frontier and explored set, so one solver can be
// reused after a failure and shared between threads.
class PuzzleSolver {
public:
    explicit PuzzleSolver(SolveOptions options = {},
                          std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    // Shortest move sequence from start to goal.
    // Throws UnsolvableError if the frontier runs dry and SearchBudgetExceededError if a
    // limit in options() is hit. Never returns a partial path.
    Solution solve(const Board& start, const Board& goal = Board::goal()) const;

    const SolveOptions& options() const { return options_; }
    const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }

private:
    SolveOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // PUZZLE_SOLVER_HPP
