#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "PuzzleSolver.hpp"

// Process exit codes of the eight_puzzle tool
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUnsolvable = 2;
constexpr int kExitBudgetExceeded = 3;

struct CommandLineOptions {
    bool show_help = false;
    std::string input_file;      // empty: scramble a random board
    SolveOptions solve;
    std::uint32_t seed = 0;
};

// Parses "[input_file|--random] [time_limit_seconds] [max_expansions] [seed]" (program name
// excluded). A negative or malformed limit is logged and means "no limit"; a malformed seed
// is logged and default_seed is kept.
CommandLineOptions parse_args(const std::vector<std::string>& args, std::uint32_t default_seed,
                              const std::shared_ptr<spdlog::logger>& logger);

// Loads or scrambles the start board, solves it and prints the solution.
// Returns one of the kExit* codes; errors are logged, never thrown.
int run(const CommandLineOptions& options, const std::shared_ptr<spdlog::logger>& logger);

#endif // COMMAND_LINE_HPP
