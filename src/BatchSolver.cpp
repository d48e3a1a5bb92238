#include "BatchSolver.hpp"

#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include <utility>

BatchSolver::BatchSolver(PuzzleSolver solver, int num_threads)
    : solver_(std::move(solver)), num_threads_(num_threads) {}

std::vector<BatchResult> BatchSolver::solve_all(const std::vector<Board>& starts, const Board& goal) const {
    std::vector<BatchResult> results;
    results.reserve(starts.size());
    for (const Board& start : starts) {
        results.push_back(BatchResult{start, std::nullopt, {}});
    }

    tbb::task_arena arena(num_threads_ > 0 ? num_threads_ : tbb::task_arena::automatic);
    solver_.logger()->info("Solving {} puzzles with {} threads.", starts.size(), arena.max_concurrency());

    arena.execute([&] {
        tbb::task_group tg;
        for (size_t i = 0; i < results.size(); ++i) {
            // Each task owns results[i]; no other task touches it
            tg.run([this, &results, &goal, i] {
                BatchResult& result = results[i];
                try {
                    result.solution = solver_.solve(result.start, goal);
                } catch (const PuzzleError& e) {
                    solver_.logger()->warn("Puzzle {} failed: {}", i, e.what());
                    result.error = e.what();
                }
            });
        }
        tg.wait();
    });

    return results;
}
