#include "ghostscrub/cli_args.hpp"

#include <string>

namespace ghostscrub {

void print_usage(std::ostream& out) {
    out << "ghostscrub " << kVersion << " - strip invisible characters from text and code files" << std::endl;
    out << std::endl;
    out << "Usage:" << std::endl;
    out << "  ghostscrub [options] [PATH...]   Clean files, directories or glob patterns (default: .)" << std::endl;
    out << "  ghostscrub init [--force]        Write a default .ghostscrub.json configuration" << std::endl;
    out << std::endl;
    out << "Options:" << std::endl;
    out << "  -n, --dry-run        Show what would be changed without modifying files." << std::endl;
    out << "  -w, --watch          Watch the paths and clean files as they change." << std::endl;
    out << "  -c, --config <file>  Configuration file (default: .ghostscrub.json)." << std::endl;
    out << "  -v, --verbose        Show a line-by-line diff of every change." << std::endl;
    out << "  -f, --force          (init) Overwrite an existing configuration file." << std::endl;
    out << "  -h, --help           Show this help." << std::endl;
    out << "      --version        Show the version." << std::endl;
}

bool parse_cli_arguments(int argc, char* argv[], CliArgs& args, std::ostream& err) {
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!options_done && arg.size() > 1 && arg[0] == '-') {
            if (arg == "--") options_done = true;
            else if (arg == "--help" || arg == "-h") args.show_help = true;
            else if (arg == "--version") args.show_version = true;
            else if (arg == "--dry-run" || arg == "-n") args.dry_run = true;
            else if (arg == "--watch" || arg == "-w") args.watch = true;
            else if (arg == "--verbose" || arg == "-v") args.verbose = true;
            else if ((arg == "--force" || arg == "-f") && args.init) args.force = true;
            else if ((arg == "--config" || arg == "-c") && i + 1 < argc) args.config_file = std::filesystem::path(argv[++i]);
            else {
                err << "Error: Unknown argument or missing value for argument: " << arg << std::endl;
                err << "Use -h or --help for usage information." << std::endl;
                return false;
            }
        } else if (arg == "init" && !args.init && args.paths.empty() && !options_done) {
            args.init = true;
        } else if (args.init) {
            err << "Error: init does not take paths: " << arg << std::endl;
            return false;
        } else {
            args.paths.emplace_back(arg);
        }
    }

    if (args.init && (args.dry_run || args.watch || args.verbose || args.config_file)) {
        err << "Error: init only accepts --force." << std::endl;
        return false;
    }
    if (args.paths.empty()) args.paths.emplace_back(".");
    return true;
}

} // namespace ghostscrub
