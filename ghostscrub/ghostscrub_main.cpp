// ghostscrub: strips invisible and problematic Unicode characters from text
// and source files, once or continuously in watch mode.
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>

#include <signal.h>     // For sigaction

#include "ghostscrub/cli_args.hpp"
#include "ghostscrub/console.hpp"
#include "ghostscrub/file_processor.hpp"
#include "ghostscrub/file_watcher.hpp"
#include "ghostscrub/inotify_notifier.hpp"
#include "ghostscrub/scrub_config.hpp"
#include "ghostscrub/scrub_error.hpp"
#include "ghostscrub/tree_walker.hpp"

namespace fs = std::filesystem;
using namespace ghostscrub;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) {
    g_stop_requested.store(true);
}

void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: poll() should return promptly
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int run_init(bool force) {
    const fs::path config_path(kDefaultConfigFile);
    std::error_code ec;
    if (fs::exists(config_path, ec) && !force) {
        std::cerr << "Error: Configuration file " << config_path.string()
                  << " already exists. Use --force to overwrite." << std::endl;
        return 1;
    }
    try {
        write_configuration(config_path, Configuration::defaults());
    } catch (const ScrubError& e) {
        std::cerr << "Error: Could not write " << config_path.string() << ": " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Created " << config_path.string() << " configuration file with default settings." << std::endl;
    return 0;
}

std::optional<Configuration> load_config(const CliArgs& args) {
    try {
        if (args.config_file) return load_configuration(*args.config_file);
        return load_default_configuration();
    } catch (const ScrubError& e) {
        std::cerr << "Error: Could not load configuration: " << e.what() << std::endl;
        return std::nullopt;
    }
}

int run_single_pass(const CliArgs& args, const FileProcessor& processor, const Console& console) {
    TreeWalker walker(processor);
    const WalkResult result = walker.process_paths(args.paths, args.dry_run, args.verbose);
    result.print_summary(console, args.dry_run);
    return 0;
}

int run_watch_mode(const CliArgs& args, const FileProcessor& processor) {
    install_signal_handlers();
    try {
        InotifyNotifier notifier;
        FileWatcher watcher(processor, notifier);
        watcher.run(args.paths, g_stop_requested);
    } catch (const ScrubError& e) {
        std::cerr << "Error: Watch mode failed: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "File watcher stopped." << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    if (!parse_cli_arguments(argc, argv, args)) {
        return 1;
    }
    if (args.show_help) {
        print_usage(std::cout);
        return 0;
    }
    if (args.show_version) {
        std::cout << "ghostscrub " << kVersion << std::endl;
        return 0;
    }
    if (args.init) {
        return run_init(args.force);
    }

    std::optional<Configuration> config = load_config(args);
    if (!config) {
        return 1;
    }

    Console console(config->verbosity);
    report_configuration_warnings(*config, console);
    if (!args.config_file) {
        report_legacy_configuration(kDefaultConfigFile, console);
    }

    FileProcessor processor(*config, console);
    if (args.watch) {
        return run_watch_mode(args, processor);
    }
    return run_single_pass(args, processor, console);
}
