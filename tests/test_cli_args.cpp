#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "ghostscrub/cli_args.hpp"

using namespace ghostscrub;
namespace fs = std::filesystem;

namespace {

struct ParseOutcome {
    bool ok = false;
    CliArgs args;
    std::string errors;
};

ParseOutcome parse(std::vector<std::string> words) {
    words.insert(words.begin(), "ghostscrub");
    std::vector<char*> argv;
    for (auto& word : words) argv.push_back(word.data());
    argv.push_back(nullptr);

    ParseOutcome outcome;
    std::ostringstream err;
    outcome.ok = parse_cli_arguments(static_cast<int>(words.size()), argv.data(), outcome.args, err);
    outcome.errors = err.str();
    return outcome;
}

} // namespace

TEST_CASE("Default invocation") {
    const auto outcome = parse({});
    REQUIRE(outcome.ok);
    REQUIRE(outcome.args.paths == std::vector<fs::path>{"."});
    REQUIRE_FALSE(outcome.args.dry_run);
    REQUIRE_FALSE(outcome.args.watch);
    REQUIRE_FALSE(outcome.args.verbose);
    REQUIRE_FALSE(outcome.args.init);
    REQUIRE_FALSE(outcome.args.config_file.has_value());
}

TEST_CASE("Flags and paths") {
    SECTION("Long options") {
        const auto outcome = parse({"--dry-run", "src", "--verbose", "--config", "my.json", "docs/*.md"});
        REQUIRE(outcome.ok);
        REQUIRE(outcome.args.dry_run);
        REQUIRE(outcome.args.verbose);
        REQUIRE(outcome.args.config_file == fs::path("my.json"));
        REQUIRE(outcome.args.paths == std::vector<fs::path>{"src", "docs/*.md"});
    }

    SECTION("Short options") {
        const auto outcome = parse({"-n", "-w", "-v", "-c", "cfg.json", "."});
        REQUIRE(outcome.ok);
        REQUIRE(outcome.args.dry_run);
        REQUIRE(outcome.args.watch);
        REQUIRE(outcome.args.verbose);
        REQUIRE(outcome.args.config_file == fs::path("cfg.json"));
    }

    SECTION("Double dash ends the options") {
        const auto outcome = parse({"--", "-odd-name.txt"});
        REQUIRE(outcome.ok);
        REQUIRE(outcome.args.paths == std::vector<fs::path>{"-odd-name.txt"});
    }

    SECTION("Help and version") {
        REQUIRE(parse({"--help"}).args.show_help);
        REQUIRE(parse({"-h"}).args.show_help);
        REQUIRE(parse({"--version"}).args.show_version);
    }
}

TEST_CASE("Init command") {
    SECTION("Plain") {
        const auto outcome = parse({"init"});
        REQUIRE(outcome.ok);
        REQUIRE(outcome.args.init);
        REQUIRE_FALSE(outcome.args.force);
    }

    SECTION("Forced") {
        REQUIRE(parse({"init", "--force"}).args.force);
        REQUIRE(parse({"init", "-f"}).args.force);
    }

    SECTION("A path named init after another path is just a path") {
        const auto outcome = parse({"src", "init"});
        REQUIRE(outcome.ok);
        REQUIRE_FALSE(outcome.args.init);
        REQUIRE(outcome.args.paths == std::vector<fs::path>{"src", "init"});
    }

    SECTION("Init rejects other options and paths") {
        REQUIRE_FALSE(parse({"init", "--watch"}).ok);
        REQUIRE_FALSE(parse({"init", "somewhere"}).ok);
    }
}

TEST_CASE("Malformed command lines") {
    SECTION("Unknown option") {
        const auto outcome = parse({"--frobnicate"});
        REQUIRE_FALSE(outcome.ok);
        REQUIRE(outcome.errors.find("Error: Unknown argument or missing value for argument: --frobnicate") == 0);
        REQUIRE(outcome.errors.find("--help") != std::string::npos);
    }

    SECTION("Missing config value") {
        REQUIRE_FALSE(parse({"--config"}).ok);
    }

    SECTION("Force outside init") {
        REQUIRE_FALSE(parse({"--force"}).ok);
    }
}

TEST_CASE("Usage text") {
    std::ostringstream out;
    print_usage(out);
    const std::string text = out.str();
    for (const char* flag : {"--dry-run", "--watch", "--config", "--verbose", "--force", "--help", "--version"}) {
        INFO("flag: " << flag);
        REQUIRE(text.find(flag) != std::string::npos);
    }
}
