#ifndef SOLUTION_PRINTER_HPP
#define SOLUTION_PRINTER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "PuzzleSolver.hpp"

// Human-readable listing of a solution: the start board, then "Step k: <Move>" and the
// resulting board for every move
std::string format_solution(const Solution& solution);

// Logs format_solution() at info level
void print_solution(const Solution& solution, const std::shared_ptr<spdlog::logger>& logger);

#endif // SOLUTION_PRINTER_HPP
