// Google Test for argument parsing and the exit codes of the eight_puzzle tool
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>

#include "CommandLine.hpp"

namespace fs = std::filesystem;

static std::shared_ptr<spdlog::logger> capture_logger(std::ostringstream& out) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("command_line_test", sink);
    logger->set_level(spdlog::level::info);
    return logger;
}

// Writes contents to a file named after the running test and returns its path
static std::string write_puzzle_file(const std::string& contents) {
    std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    fs::path path = fs::temp_directory_path() / ("eight_puzzle_" + name + ".txt");
    std::ofstream out(path);
    out << contents;
    return path.string();
}

TEST(CommandLine, DefaultsWithoutArguments) {
    std::ostringstream log;
    CommandLineOptions options = parse_args({}, 42, capture_logger(log));

    EXPECT_FALSE(options.show_help);
    EXPECT_TRUE(options.input_file.empty());
    EXPECT_EQ(options.solve.time_limit.count(), 0);
    EXPECT_EQ(options.solve.max_expansions, 0u);
    EXPECT_EQ(options.seed, 42u);
}

TEST(CommandLine, ParsesAllPositionals) {
    std::ostringstream log;
    CommandLineOptions options = parse_args({"puzzle.txt", "5", "1000", "7"}, 42, capture_logger(log));

    EXPECT_EQ(options.input_file, "puzzle.txt");
    EXPECT_EQ(options.solve.time_limit, std::chrono::milliseconds(5000));
    EXPECT_EQ(options.solve.max_expansions, 1000u);
    EXPECT_EQ(options.seed, 7u);
}

TEST(CommandLine, RandomKeywordMeansNoInputFile) {
    std::ostringstream log;
    CommandLineOptions options = parse_args({"--random"}, 1, capture_logger(log));
    EXPECT_TRUE(options.input_file.empty());
}

TEST(CommandLine, NegativeOrInvalidTimeLimitMeansNoLimit) {
    std::ostringstream log;
    auto logger = capture_logger(log);

    EXPECT_EQ(parse_args({"--random", "-3"}, 1, logger).solve.time_limit.count(), 0);
    EXPECT_NE(log.str().find("negative"), std::string::npos);

    EXPECT_EQ(parse_args({"--random", "soon"}, 1, logger).solve.time_limit.count(), 0);
    EXPECT_NE(log.str().find("Must be an integer"), std::string::npos);

    EXPECT_EQ(parse_args({"--random", "0", "-1"}, 1, logger).solve.max_expansions, 0u);
}

TEST(CommandLine, HugeTimeLimitFallsBackInsteadOfOverflowing) {
    std::ostringstream log;
    auto logger = capture_logger(log);

    CommandLineOptions huge = parse_args({"--random", "10000000000000000"}, 1, logger);
    EXPECT_EQ(huge.solve.time_limit.count(), 0);
    EXPECT_NE(log.str().find("out of range"), std::string::npos);

    // largest accepted value converts exactly
    CommandLineOptions largest = parse_args({"--random", "2147483647"}, 1, logger);
    EXPECT_EQ(largest.solve.time_limit.count(), 2147483647LL * 1000);
}

TEST(CommandLine, InvalidSeedKeepsDefaultSeed) {
    std::ostringstream log;
    auto logger = capture_logger(log);

    EXPECT_EQ(parse_args({"--random", "0", "0", "abc"}, 99, logger).seed, 99u);
    EXPECT_NE(log.str().find("Keeping seed 99"), std::string::npos);
    EXPECT_EQ(log.str().find("no limit"), std::string::npos);

    EXPECT_EQ(parse_args({"--random", "0", "0", "4294967296"}, 99, logger).seed, 99u);
    EXPECT_EQ(parse_args({"--random", "0", "0", "-5"}, 99, logger).seed, 99u);
    EXPECT_EQ(parse_args({"--random", "0", "0", "4294967295"}, 99, logger).seed, 4294967295u);
}

TEST(CommandLine, HelpExitsCleanly) {
    std::ostringstream log;
    auto logger = capture_logger(log);
    CommandLineOptions options = parse_args({"--help"}, 1, logger);
    EXPECT_TRUE(options.show_help);
    EXPECT_EQ(run(options, logger), kExitOk);
    EXPECT_NE(log.str().find("Usage"), std::string::npos);
}

TEST(CommandLine, SolvesPuzzleFile) {
    std::ostringstream log;
    auto logger = capture_logger(log);
    std::string path = write_puzzle_file("3 3\n1 2 3\n4 0 6\n7 5 8\n");

    EXPECT_EQ(run(parse_args({path}, 1, logger), logger), kExitOk);
    EXPECT_NE(log.str().find("Cost: 2 steps"), std::string::npos);
    fs::remove(path);
}

TEST(CommandLine, RandomScrambleIsSolved) {
    std::ostringstream log;
    auto logger = capture_logger(log);

    EXPECT_EQ(run(parse_args({"--random", "0", "0", "2024"}, 1, logger), logger), kExitOk);
    EXPECT_NE(log.str().find("seed 2024"), std::string::npos);
    EXPECT_NE(log.str().find("Solution found"), std::string::npos);
}

TEST(CommandLine, UnsolvableBoardExitsWithTwo) {
    std::ostringstream log;
    auto logger = capture_logger(log);
    std::string path = write_puzzle_file("3 3\n2 1 3 4 5 6 7 8 0\n");

    EXPECT_EQ(run(parse_args({path}, 1, logger), logger), kExitUnsolvable);
    // rejected before any search starts
    EXPECT_EQ(log.str().find("Starting A* search"), std::string::npos);
    fs::remove(path);
}

TEST(CommandLine, BudgetOverrunExitsWithThree) {
    std::ostringstream log;
    auto logger = capture_logger(log);
    std::string path = write_puzzle_file("3 3\n8 6 7 2 5 4 3 0 1\n");

    EXPECT_EQ(run(parse_args({path, "0", "1"}, 1, logger), logger), kExitBudgetExceeded);
    EXPECT_NE(log.str().find("Expansion limit of 1 nodes exceeded"), std::string::npos);
    fs::remove(path);
}

TEST(CommandLine, BadInputExitsWithOne) {
    std::ostringstream log;
    auto logger = capture_logger(log);

    EXPECT_EQ(run(parse_args({"/nonexistent/puzzle.txt"}, 1, logger), logger), kExitError);

    std::string path = write_puzzle_file("3 3\n1 2 3 4 5 6 3 8 0\n");
    EXPECT_EQ(run(parse_args({path}, 1, logger), logger), kExitError);
    EXPECT_NE(log.str().find("Duplicate label"), std::string::npos);
    fs::remove(path);
}
