#ifndef BATCH_SOLVER_HPP
#define BATCH_SOLVER_HPP

#include <optional>
#include <string>
#include <vector>

#include "PuzzleSolver.hpp"

// Outcome of one puzzle in a batch: either a solution or the error message
struct BatchResult {
    Board start;
    std::optional<Solution> solution;
    std::string error;

    bool ok() const { return solution.has_value(); }
};

// Solves independent puzzles concurrently on a TBB task arena.
// Every puzzle gets its own solve() call; a PuzzleError in one does not affect the others.
// Batch progress is logged through the solver's logger.
class BatchSolver {
public:
    // num_threads == 0 lets TBB pick
    explicit BatchSolver(PuzzleSolver solver, int num_threads = 0);

    // Results are in the same order as starts
    std::vector<BatchResult> solve_all(const std::vector<Board>& starts, const Board& goal = Board::goal()) const;

private:
    PuzzleSolver solver_;
    int num_threads_;
};

#endif // BATCH_SOLVER_HPP
