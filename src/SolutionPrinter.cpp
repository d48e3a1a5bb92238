#include "SolutionPrinter.hpp"

std::string format_solution(const Solution& solution) {
    std::string out;
    if (solution.path.empty()) {
        return out;
    }
    out += "Start:\n" + solution.path.front().to_string();
    for (size_t i = 0; i < solution.moves.size(); ++i) {
        out += "Step " + std::to_string(i + 1) + ": " + to_string(solution.moves[i]) + "\n";
        out += solution.path[i + 1].to_string();
    }
    return out;
}

void print_solution(const Solution& solution, const std::shared_ptr<spdlog::logger>& logger) {
    logger->info("Solution (Cost: {} steps):\n{}", solution.cost, format_solution(solution));
}
