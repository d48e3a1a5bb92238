// main.cpp
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "CommandLine.hpp"

int main(int argc, char* argv[]) {
    auto console_logger = spdlog::stdout_color_mt("main_logger");
    spdlog::set_default_logger(console_logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    std::uint32_t default_seed =
        static_cast<std::uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count());

    CommandLineOptions options = parse_args(args, default_seed, console_logger);
    return run(options, console_logger);
}
