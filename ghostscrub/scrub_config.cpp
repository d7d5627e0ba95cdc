#include "ghostscrub/scrub_config.hpp"

#include <fstream>
#include <utility>      // For std::move

#include "ghostscrub/glob_pattern.hpp"
#include "ghostscrub/scrub_error.hpp"
#include "ghostscrub/unicode_utils.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ghostscrub {

std::vector<std::string> default_include_extensions() {
    return {
        "rs", "py", "js", "ts", "jsx", "tsx", "go", "java", "c", "cpp", "h",
        "hpp", "cs", "php", "rb", "swift", "kt", "scala", "clj", "hs", "ml",
        "txt", "md", "json", "xml", "yaml", "yml", "toml", "ini", "cfg", "conf",
    };
}

std::vector<std::string> default_include_patterns() {
    return {"**/*"};
}

std::vector<std::string> default_exclude_patterns() {
    return {
        // Version control
        "**/.git/**", "**/.svn/**", "**/.hg/**", "**/.bzr/**",
        // Build output and dependencies
        "**/target/**", "**/node_modules/**", "**/build/**", "**/dist/**",
        "**/out/**", "**/bin/**", "**/obj/**",
        // Python
        "**/__pycache__/**", "**/.pytest_cache/**", "**/venv/**", "**/.venv/**",
        "**/*.egg-info/**",
        // Editors and IDEs
        "**/.idea/**", "**/.vscode/**", "**/.vs/**", "**/*.swp", "**/*.swo",
        "**/*~", "**/.#*",
        // OS droppings
        "**/.DS_Store", "**/Thumbs.db", "**/desktop.ini",
        // Temporary files
        "**/*.tmp", "**/*.temp", "**/*.bak", "**/*.orig",
        // Logs
        "**/*.log", "**/logs/**",
    };
}

Configuration Configuration::defaults() {
    Configuration config;
    config.include_extensions = default_include_extensions();
    config.include_patterns = default_include_patterns();
    config.exclude_patterns = default_exclude_patterns();
    return config;
}

Verbosity parse_verbosity(const std::string& text) {
    if (text == "silent") return Verbosity::Silent;
    if (text == "normal") return Verbosity::Normal;
    if (text == "verbose") return Verbosity::Verbose;
    throw ScrubError(ErrorKind::ConfigParse,
                     "invalid verbosity '" + text + "' (expected silent, normal or verbose)");
}

const char* verbosity_name(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::Silent:  return "silent";
        case Verbosity::Normal:  return "normal";
        case Verbosity::Verbose: return "verbose";
    }
    return "normal";
}

namespace {

void read_string_list(const json& object, const char* key, std::vector<std::string>& target) {
    auto it = object.find(key);
    if (it == object.end()) return;
    if (!it->is_array()) {
        throw ScrubError(ErrorKind::ConfigParse, std::string("'") + key + "' must be an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw ScrubError(ErrorKind::ConfigParse, std::string("'") + key + "' must contain only strings");
        }
        values.push_back(item.get<std::string>());
    }
    target = std::move(values);
}

void read_flag(const json& object, const char* key, bool& target) {
    auto it = object.find(key);
    if (it == object.end()) return;
    if (!it->is_boolean()) {
        throw ScrubError(ErrorKind::ConfigParse,
                         std::string("'target_characters.") + key + "' must be true or false");
    }
    target = it->get<bool>();
}

} // namespace

Configuration Configuration::from_json(const json& document) {
    if (!document.is_object()) {
        throw ScrubError(ErrorKind::ConfigParse, "configuration document must be a JSON object");
    }

    Configuration config = Configuration::defaults();
    read_string_list(document, "include_extensions", config.include_extensions);
    read_string_list(document, "exclude_extensions", config.exclude_extensions);
    read_string_list(document, "include_patterns", config.include_patterns);
    read_string_list(document, "exclude_patterns", config.exclude_patterns);

    auto targets = document.find("target_characters");
    if (targets != document.end()) {
        if (!targets->is_object()) {
            throw ScrubError(ErrorKind::ConfigParse, "'target_characters' must be an object");
        }
        TargetCharacters& tc = config.target_characters;
        read_flag(*targets, "zero_width_spaces", tc.zero_width_spaces);
        read_flag(*targets, "non_breaking_spaces", tc.non_breaking_spaces);
        read_flag(*targets, "control_characters", tc.control_characters);
        read_flag(*targets, "unicode_whitespace", tc.unicode_whitespace);
        read_flag(*targets, "trailing_whitespace", tc.trailing_whitespace);
        read_string_list(*targets, "custom_chars", tc.custom_chars);
    }

    auto verbosity = document.find("verbosity");
    if (verbosity != document.end()) {
        if (!verbosity->is_string()) {
            throw ScrubError(ErrorKind::ConfigParse, "'verbosity' must be a string");
        }
        config.verbosity = parse_verbosity(verbosity->get<std::string>());
    }
    return config;
}

json Configuration::to_json() const {
    json document;
    document["include_extensions"] = include_extensions;
    document["exclude_extensions"] = exclude_extensions;
    document["include_patterns"] = include_patterns;
    document["exclude_patterns"] = exclude_patterns;
    document["target_characters"] = {
        {"zero_width_spaces", target_characters.zero_width_spaces},
        {"non_breaking_spaces", target_characters.non_breaking_spaces},
        {"control_characters", target_characters.control_characters},
        {"unicode_whitespace", target_characters.unicode_whitespace},
        {"trailing_whitespace", target_characters.trailing_whitespace},
        {"custom_chars", target_characters.custom_chars},
    };
    document["verbosity"] = verbosity_name(verbosity);
    return document;
}

namespace {

Configuration parse_configuration_file(std::ifstream& config_file, const fs::path& path) {
    json document;
    try {
        config_file >> document;
    } catch (const json::parse_error& e) {
        throw ScrubError(ErrorKind::ConfigParse,
                         "could not parse " + path.string() + ": " + e.what(), path.string());
    }
    try {
        return Configuration::from_json(document);
    } catch (const ScrubError& e) {
        throw ScrubError(e.kind(), path.string() + ": " + e.what(), path.string());
    }
}

} // namespace

Configuration load_configuration(const fs::path& path) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        throw ScrubError(ErrorKind::ConfigIo, "could not open config file " + path.string(), path.string());
    }
    return parse_configuration_file(config_file, path);
}

Configuration load_default_configuration(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return Configuration::defaults();

    std::ifstream config_file(path);
    if (!config_file.is_open()) return Configuration::defaults();
    return parse_configuration_file(config_file, path);
}

void write_configuration(const fs::path& path, const Configuration& config) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw ScrubError(ErrorKind::FileWrite, "could not open " + path.string() + " for writing", path.string());
    }
    out << config.to_json().dump(4) << std::endl;
    if (!out) {
        throw ScrubError(ErrorKind::FileWrite, "could not write " + path.string(), path.string());
    }
}

int report_configuration_warnings(const Configuration& config, const Console& console) {
    int warnings = 0;
    for (const auto& entry : config.target_characters.custom_chars) {
        if (!unicode::parse_code_point(entry)) {
            console.warning("Warning: Ignoring custom character '" + entry + "': not a hex code point.");
            ++warnings;
        }
    }
    for (const auto& pattern : config.exclude_patterns) {
        try {
            GlobPattern compiled(pattern);
        } catch (const ScrubError& e) {
            console.warning("Warning: Ignoring exclude pattern '" + pattern + "': " + e.what());
            ++warnings;
        }
    }
    return warnings;
}

bool report_legacy_configuration(const fs::path& default_path, const Console& console) {
    std::error_code ec;
    if (fs::exists(default_path, ec)) return false;
    const fs::path legacy = default_path.parent_path() / kLegacyConfigFile;
    if (!fs::exists(legacy, ec)) return false;
    console.warning("Warning: Ignoring " + legacy.string() + ": settings are now read from " +
                    default_path.string() + ". Run 'ghostscrub init' and carry your settings over.");
    return true;
}

} // namespace ghostscrub
