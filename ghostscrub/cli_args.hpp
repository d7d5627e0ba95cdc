#pragma once
/*
 * Command-line arguments.
 *
 *   ghostscrub [--dry-run] [--watch] [--config FILE] [--verbose] [PATH...]
 *   ghostscrub init [--force]
 */
#include <filesystem>
#include <iostream>
#include <optional>
#include <vector>

namespace ghostscrub {

inline constexpr const char* kVersion = "0.1.0";

struct CliArgs {
    std::vector<std::filesystem::path> paths; // "." when none were given
    std::optional<std::filesystem::path> config_file;
    bool dry_run = false;
    bool watch = false;
    bool verbose = false;
    bool init = false;
    bool force = false; // init only
    bool show_help = false;
    bool show_version = false;
};

void print_usage(std::ostream& out);

// Returns false on a malformed command line after printing the reason to `err`.
bool parse_cli_arguments(int argc, char* argv[], CliArgs& args, std::ostream& err = std::cerr);

} // namespace ghostscrub
