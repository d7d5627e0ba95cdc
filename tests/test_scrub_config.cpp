#include <catch2/catch.hpp>

#include <sstream>

#include <nlohmann/json.hpp>

#include "ghostscrub/scrub_config.hpp"
#include "ghostscrub/scrub_error.hpp"
#include "test_support.hpp"

using namespace ghostscrub;
using json = nlohmann::json;

namespace {

ErrorKind kind_of_failure(const json& document) {
    try {
        Configuration::from_json(document);
    } catch (const ScrubError& e) {
        return e.kind();
    }
    FAIL("expected ScrubError for " << document.dump());
    return ErrorKind::ConfigIo;
}

} // namespace

TEST_CASE("Default configuration") {
    const Configuration config = Configuration::defaults();
    REQUIRE(config.include_extensions.size() == 31);
    REQUIRE(config.include_extensions.front() == "rs");
    REQUIRE(config.include_extensions.back() == "conf");
    REQUIRE(config.exclude_extensions.empty());
    REQUIRE(config.include_patterns == std::vector<std::string>{"**/*"});
    REQUIRE(config.exclude_patterns.size() == 32);
    REQUIRE(config.exclude_patterns.front() == "**/.git/**");
    REQUIRE(config.target_characters.zero_width_spaces);
    REQUIRE(config.target_characters.non_breaking_spaces);
    REQUIRE(config.target_characters.control_characters);
    REQUIRE(config.target_characters.unicode_whitespace);
    REQUIRE(config.target_characters.trailing_whitespace);
    REQUIRE(config.target_characters.custom_chars.empty());
    REQUIRE(config.verbosity == Verbosity::Normal);
}

TEST_CASE("Reading a configuration document") {
    SECTION("Missing keys keep their defaults") {
        const Configuration config = Configuration::from_json(json::object());
        REQUIRE(config.include_extensions == default_include_extensions());
        REQUIRE(config.exclude_patterns == default_exclude_patterns());
    }

    SECTION("Every field") {
        const json document = json::parse(R"({
            "include_extensions": ["py"],
            "exclude_extensions": ["md"],
            "include_patterns": ["src/**"],
            "exclude_patterns": ["**/vendor/**"],
            "target_characters": {
                "zero_width_spaces": false,
                "trailing_whitespace": false,
                "custom_chars": ["U+00AD"]
            },
            "verbosity": "verbose",
            "unknown_key": 42
        })");
        const Configuration config = Configuration::from_json(document);
        REQUIRE(config.include_extensions == std::vector<std::string>{"py"});
        REQUIRE(config.exclude_extensions == std::vector<std::string>{"md"});
        REQUIRE(config.include_patterns == std::vector<std::string>{"src/**"});
        REQUIRE(config.exclude_patterns == std::vector<std::string>{"**/vendor/**"});
        REQUIRE_FALSE(config.target_characters.zero_width_spaces);
        REQUIRE(config.target_characters.non_breaking_spaces);
        REQUIRE_FALSE(config.target_characters.trailing_whitespace);
        REQUIRE(config.target_characters.custom_chars == std::vector<std::string>{"U+00AD"});
        REQUIRE(config.verbosity == Verbosity::Verbose);
    }

    SECTION("Wrong types are parse errors") {
        REQUIRE(kind_of_failure(json::array()) == ErrorKind::ConfigParse);
        REQUIRE(kind_of_failure({{"include_extensions", "rs"}}) == ErrorKind::ConfigParse);
        REQUIRE(kind_of_failure({{"exclude_patterns", {1, 2}}}) == ErrorKind::ConfigParse);
        REQUIRE(kind_of_failure({{"target_characters", true}}) == ErrorKind::ConfigParse);
        REQUIRE(kind_of_failure({{"target_characters", {{"zero_width_spaces", "yes"}}}}) == ErrorKind::ConfigParse);
        REQUIRE(kind_of_failure({{"verbosity", 3}}) == ErrorKind::ConfigParse);
        REQUIRE(kind_of_failure({{"verbosity", "loud"}}) == ErrorKind::ConfigParse);
    }

    SECTION("Serialization keeps every field") {
        Configuration config = Configuration::defaults();
        config.exclude_extensions = {"lock"};
        config.target_characters.control_characters = false;
        config.verbosity = Verbosity::Silent;

        const json document = config.to_json();
        REQUIRE(document["verbosity"] == "silent");
        REQUIRE(document["target_characters"]["control_characters"] == false);

        const Configuration reread = Configuration::from_json(document);
        REQUIRE(reread.exclude_extensions == config.exclude_extensions);
        REQUIRE_FALSE(reread.target_characters.control_characters);
        REQUIRE(reread.verbosity == Verbosity::Silent);
    }
}

TEST_CASE("Configuration files") {
    test::TempDir tmp;

    SECTION("Absent default file yields defaults") {
        const Configuration config = load_default_configuration(tmp / ".ghostscrub.json");
        REQUIRE(config.include_extensions == default_include_extensions());
    }

    SECTION("Absent explicit file is an I/O error") {
        try {
            load_configuration(tmp / "nope.json");
            FAIL("expected ScrubError");
        } catch (const ScrubError& e) {
            REQUIRE(e.kind() == ErrorKind::ConfigIo);
            REQUIRE(e.is_fatal());
        }
    }

    SECTION("Malformed JSON is a parse error for both lookups") {
        const auto path = tmp / "broken.json";
        test::write_file(path, "{ \"verbosity\": ");
        REQUIRE_THROWS_AS(load_configuration(path), ScrubError);
        try {
            load_default_configuration(path);
            FAIL("expected ScrubError");
        } catch (const ScrubError& e) {
            REQUIRE(e.kind() == ErrorKind::ConfigParse);
            REQUIRE(std::string(e.what()).find("broken.json") != std::string::npos);
        }
    }

    SECTION("Written configuration reads back") {
        const auto path = tmp / ".ghostscrub.json";
        Configuration config = Configuration::defaults();
        config.target_characters.custom_chars = {"U+2060"};
        write_configuration(path, config);

        const std::string text = test::read_file(path);
        REQUIRE(text.find("\n    \"exclude_extensions\"") != std::string::npos); // four-space indent

        const Configuration reread = load_configuration(path);
        REQUIRE(reread.target_characters.custom_chars == std::vector<std::string>{"U+2060"});
        REQUIRE(reread.exclude_patterns == default_exclude_patterns());
    }
}

TEST_CASE("Configuration warnings") {
    Configuration config = Configuration::defaults();
    config.target_characters.custom_chars = {"U+200B", "zzz"};
    config.exclude_patterns.push_back("[oops");

    std::ostringstream out;
    std::ostringstream err;
    Console console(Verbosity::Normal, out, err);

    REQUIRE(report_configuration_warnings(config, console) == 2);
    REQUIRE(err.str().find("Warning: Ignoring custom character 'zzz'") != std::string::npos);
    REQUIRE(err.str().find("Warning: Ignoring exclude pattern '[oops'") != std::string::npos);
    REQUIRE(out.str().empty());

    std::ostringstream quiet;
    Console clean_console(Verbosity::Normal, out, quiet);
    REQUIRE(report_configuration_warnings(Configuration::defaults(), clean_console) == 0);
    REQUIRE(quiet.str().empty());
}

TEST_CASE("Verbosity names") {
    REQUIRE(parse_verbosity("silent") == Verbosity::Silent);
    REQUIRE(parse_verbosity("normal") == Verbosity::Normal);
    REQUIRE(parse_verbosity("verbose") == Verbosity::Verbose);
    REQUIRE_THROWS_AS(parse_verbosity("Verbose"), ScrubError);
    REQUIRE(std::string(verbosity_name(Verbosity::Verbose)) == "verbose");
}

TEST_CASE("Legacy configuration file") {
    test::TempDir tmp;
    std::ostringstream out;
    std::ostringstream err;
    Console console(Verbosity::Normal, out, err);
    const auto json_path = tmp / ".ghostscrub.json";

    SECTION("Nothing to report without a legacy file") {
        REQUIRE_FALSE(report_legacy_configuration(json_path, console));
        REQUIRE(err.str().empty());
    }

    SECTION("Legacy file alone is reported") {
        test::write_file(tmp / ".ghostscrub", "[target_characters]\nzero_width_spaces = true\n");
        REQUIRE(report_legacy_configuration(json_path, console));
        REQUIRE(err.str().find("Warning: Ignoring " + (tmp / ".ghostscrub").string()) == 0);
        REQUIRE(err.str().find("ghostscrub init") != std::string::npos);
    }

    SECTION("JSON file present wins quietly") {
        test::write_file(tmp / ".ghostscrub", "verbosity = \"verbose\"\n");
        test::write_file(json_path, "{}\n");
        REQUIRE_FALSE(report_legacy_configuration(json_path, console));
        REQUIRE(err.str().empty());
    }
}
