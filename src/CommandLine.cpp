#include "CommandLine.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

#include "PuzzleInput.hpp"
#include "Scrambler.hpp"
#include "Solvability.hpp"
#include "SolutionPrinter.hpp"

namespace {

// Time limit in whole seconds, read as int so the millisecond conversion cannot overflow
std::chrono::milliseconds parse_time_limit(const std::string& arg, const std::shared_ptr<spdlog::logger>& logger) {
    try {
        int seconds = std::stoi(arg);
        if (seconds < 0) {
            logger->warn("Invalid time limit specified (negative). Setting to no limit.");
            return std::chrono::milliseconds(0);
        }
        return std::chrono::seconds(seconds);
    } catch (const std::invalid_argument&) {
        logger->error("Invalid time limit argument: {}. Must be an integer. Setting to no limit.", arg);
    } catch (const std::out_of_range&) {
        logger->error("Time limit argument out of range: {}. Setting to no limit.", arg);
    }
    return std::chrono::milliseconds(0);
}

std::size_t parse_expansion_limit(const std::string& arg, const std::shared_ptr<spdlog::logger>& logger) {
    try {
        long long value = std::stoll(arg);
        if (value < 0) {
            logger->warn("Invalid expansion limit specified (negative). Setting to no limit.");
            return 0;
        }
        return static_cast<std::size_t>(value);
    } catch (const std::invalid_argument&) {
        logger->error("Invalid expansion limit argument: {}. Must be an integer. Setting to no limit.", arg);
    } catch (const std::out_of_range&) {
        logger->error("Expansion limit argument out of range: {}. Setting to no limit.", arg);
    }
    return 0;
}

std::uint32_t parse_seed(const std::string& arg, std::uint32_t fallback,
                         const std::shared_ptr<spdlog::logger>& logger) {
    try {
        if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("negative seed");
        }
        unsigned long long value = std::stoull(arg);
        if (value > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("seed does not fit in 32 bits");
        }
        return static_cast<std::uint32_t>(value);
    } catch (const std::invalid_argument&) {
        logger->error("Invalid seed argument: {}. Must be a non-negative integer. Keeping seed {}.", arg, fallback);
    } catch (const std::out_of_range&) {
        logger->error("Seed argument out of range: {}. Keeping seed {}.", arg, fallback);
    }
    return fallback;
}

} // namespace

CommandLineOptions parse_args(const std::vector<std::string>& args, std::uint32_t default_seed,
                              const std::shared_ptr<spdlog::logger>& logger) {
    CommandLineOptions options;
    options.seed = default_seed;

    if (!args.empty() && args[0] == "--help") {
        options.show_help = true;
        return options;
    }
    if (!args.empty() && args[0] != "--random") {
        options.input_file = args[0];
    }
    if (args.size() > 1) {
        options.solve.time_limit = parse_time_limit(args[1], logger);
    }
    if (args.size() > 2) {
        options.solve.max_expansions = parse_expansion_limit(args[2], logger);
    }
    if (args.size() > 3) {
        options.seed = parse_seed(args[3], default_seed, logger);
    }
    return options;
}

int run(const CommandLineOptions& options, const std::shared_ptr<spdlog::logger>& logger) {
    if (options.show_help) {
        logger->info("Usage: eight_puzzle [input_file|--random] [time_limit_seconds] [max_expansions] [seed]");
        return kExitOk;
    }

    try {
        Board start = Board::goal();
        Board goal = Board::goal();
        if (!options.input_file.empty()) {
            logger->info("Reading puzzle from file: {}", options.input_file);
            PuzzleInput input = read_puzzle_file(options.input_file);
            start = input.start;
            goal = input.goal;
        } else {
            logger->warn("No input file specified. Scrambling a random board with seed {}.", options.seed);
            Scrambler scrambler(options.seed, logger);
            start = scrambler.shuffle_solvable(goal);
        }

        if (!is_solvable(start, goal)) {
            logger->error("Board has inversion parity {} but the goal has {}; it cannot be solved.",
                          count_inversions(start) % 2, count_inversions(goal) % 2);
            return kExitUnsolvable;
        }

        PuzzleSolver solver(options.solve, logger);
        auto start_time = std::chrono::high_resolution_clock::now();
        Solution solution = solver.solve(start, goal);
        auto end_time = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> diff = end_time - start_time;

        print_solution(solution, logger);
        logger->info("Time taken: {} seconds", diff.count());
    } catch (const SearchBudgetExceededError& e) {
        logger->error("{} after {} expansions ({} ms).", e.what(), e.nodes_expanded(), e.elapsed().count());
        return kExitBudgetExceeded;
    } catch (const PuzzleError& e) {
        logger->error("Error: {}", e.what());
        return kExitError;
    } catch (const std::exception& e) {
        logger->error("Error: {}", e.what());
        return kExitError;
    }

    return kExitOk;
}
