#pragma once

#include "fairtoken/common.hpp"
#include "fairtoken/error.hpp"
#include "core/generator/settings.hpp"
#include "utils/config.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fairtoken::cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;  // configuration or validation error
constexpr int EXIT_USAGE = 2;  // malformed command line

/**
 * Parsed command line:
 *   [-c config] [-n count] [-l length] [alphabet ...]
 */
struct CommandLine {
    std::string config_path = "fairtoken.conf";
    std::optional<int64_t> length;
    std::optional<int64_t> count;
    std::vector<std::string> alphabets;
};

/**
 * Parse arguments, excluding the program name
 * @return nullopt on unknown flags, missing or non-numeric values, or -h
 */
std::optional<CommandLine> parse_command_line(const std::vector<std::string>& args);

void print_usage(std::ostream& err);

/**
 * Load the config file named on the command line, or defaults when it
 * does not exist
 * @throws ConfigurationError if the file exists but cannot be parsed
 */
utils::Config load_config(const CommandLine& cmd);

/**
 * Copy command-line values over the ones read from the file
 */
void apply_overrides(const CommandLine& cmd, utils::Config& config);

/**
 * Full tool: parse, configure logging, generate and print tokens to `out`
 * one per line
 * @return EXIT_OK, EXIT_ERROR or EXIT_USAGE
 */
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace fairtoken::cli
