#include "PuzzleSolver.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

#include "Heuristic.hpp"
#include "SearchNode.hpp"

namespace {

using Clock = std::chrono::steady_clock;

// Per-call search state: frontier, explored set and counters
struct SearchContext {
    explicit SearchContext(const Board& goal) : heuristic(goal) {}

    ManhattanHeuristic heuristic;
    Frontier open_set;
    std::unordered_map<Board, int> best_g;   // smallest g pushed so far for each board
    std::unordered_map<Board, int> explored; // g each board was expanded with
    std::size_t nodes_expanded = 0;
    std::size_t nodes_generated = 0;
};

// Walks parent links from the goal node back to the start
Solution reconstruct_path(const SearchNodePtr& goal_node) {
    Solution solution;
    solution.cost = goal_node->g_cost;
    for (const SearchNode* node = goal_node.get(); node != nullptr; node = node->parent.get()) {
        solution.path.push_back(node->board);
        if (node->move) {
            solution.moves.push_back(*node->move);
        }
    }
    std::reverse(solution.path.begin(), solution.path.end());
    std::reverse(solution.moves.begin(), solution.moves.end());
    return solution;
}

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

PuzzleSolver::PuzzleSolver(SolveOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(options), logger_(std::move(logger)) {
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }
}

Solution PuzzleSolver::solve(const Board& start, const Board& goal) const {
    logger_->info("Starting A* search. Start board:\n{}", start.to_string());
    logger_->debug("Goal board:\n{}", goal.to_string());
    if (options_.max_expansions > 0) {
        logger_->info("Expansion limit: {} nodes.", options_.max_expansions);
    }
    if (options_.time_limit.count() > 0) {
        logger_->info("Time limit: {} ms.", options_.time_limit.count());
    }

    auto start_time = Clock::now();

    if (start == goal) {
        logger_->info("Start board already matches the goal.");
        Solution solution;
        solution.path.push_back(start);
        return solution;
    }

    SearchContext ctx(goal);
    auto root = std::make_shared<const SearchNode>(start, 0, ctx.heuristic.estimate(start), std::nullopt, nullptr);
    ctx.open_set.push(root);
    ctx.best_g.emplace(start, 0);
    ctx.nodes_generated = 1;

    auto last_log_time = start_time;

    while (!ctx.open_set.empty()) {
        SearchNodePtr current = ctx.open_set.pop();

        // A cheaper copy of this board was already expanded: stale entry
        auto explored_it = ctx.explored.find(current->board);
        if (explored_it != ctx.explored.end() && explored_it->second <= current->g_cost) {
            continue;
        }

        if (current->board == goal) {
            Solution solution = reconstruct_path(current);
            solution.nodes_expanded = ctx.nodes_expanded;
            solution.nodes_generated = ctx.nodes_generated;
            logger_->info("Solution found with cost {}. Expanded {} nodes, generated {} in {} ms.", solution.cost,
                          solution.nodes_expanded, solution.nodes_generated, elapsed_since(start_time).count());
            return solution;
        }

        if (options_.max_expansions > 0 && ctx.nodes_expanded >= options_.max_expansions) {
            logger_->warn("Expansion limit of {} nodes reached. Terminating search.", options_.max_expansions);
            throw SearchBudgetExceededError("Expansion limit of " + std::to_string(options_.max_expansions) +
                                                " nodes exceeded",
                                            ctx.nodes_expanded, elapsed_since(start_time));
        }
        auto now = Clock::now();
        if (options_.time_limit.count() > 0 && now - start_time >= options_.time_limit) {
            logger_->warn("Time limit of {} ms reached. Terminating search.", options_.time_limit.count());
            throw SearchBudgetExceededError("Time limit of " + std::to_string(options_.time_limit.count()) +
                                                " ms exceeded",
                                            ctx.nodes_expanded, elapsed_since(start_time));
        }
        if (now - last_log_time >= std::chrono::seconds(5)) {
            logger_->debug("Explored {} states. Open set size: {}. Explored set size: {}", ctx.nodes_expanded,
                           ctx.open_set.size(), ctx.explored.size());
            last_log_time = now;
        }

        ctx.explored[current->board] = current->g_cost;
        ctx.nodes_expanded++;

        for (const auto& neighbor : neighbors(current->board)) {
            const Board& neighbor_board = neighbor.second;
            int new_g_cost = current->g_cost + 1; // every move costs 1

            auto it = ctx.explored.find(neighbor_board);
            if (it != ctx.explored.end() && it->second <= new_g_cost) {
                continue;
            }

            // Only push when this path beats every copy already in the frontier
            auto inserted = ctx.best_g.emplace(neighbor_board, new_g_cost);
            if (!inserted.second) {
                if (new_g_cost >= inserted.first->second) {
                    continue;
                }
                inserted.first->second = new_g_cost;
            }

            int neighbor_h = ctx.heuristic.estimate(neighbor_board);
            ctx.open_set.push(
                std::make_shared<const SearchNode>(neighbor_board, new_g_cost, neighbor_h, neighbor.first, current));
            ctx.nodes_generated++;
        }
    }

    logger_->warn("Frontier exhausted after {} expansions without reaching the goal.", ctx.nodes_expanded);
    throw UnsolvableError("No path from start to goal; frontier exhausted after " +
                          std::to_string(ctx.nodes_expanded) + " expansions");
}
