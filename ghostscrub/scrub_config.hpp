#pragma once
/*
 * Configuration
 *
 * Immutable per-run settings, read from a JSON document (.ghostscrub.json).
 * Every field is optional; missing fields fall back to the defaults below.
 * Built once in main and passed by const reference to every component.
 */
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ghostscrub/console.hpp"

namespace ghostscrub {

inline constexpr const char* kDefaultConfigFile = ".ghostscrub.json";
// TOML file read by earlier releases; no longer loaded.
inline constexpr const char* kLegacyConfigFile = ".ghostscrub";

// Which classes of characters the cleaner targets.
struct TargetCharacters {
    bool zero_width_spaces = true;
    bool non_breaking_spaces = true;
    bool control_characters = true;
    bool unicode_whitespace = true;
    bool trailing_whitespace = true;
    std::vector<std::string> custom_chars; // "U+XXXX" or "XXXX", applied in order
};

struct Configuration {
    std::vector<std::string> include_extensions;
    std::vector<std::string> exclude_extensions;
    std::vector<std::string> include_patterns;  // informational only
    std::vector<std::string> exclude_patterns;  // authoritative
    TargetCharacters target_characters;
    Verbosity verbosity = Verbosity::Normal;

    // Defaults: ~30 source/text extensions and the built-in VCS/build/editor
    // exclude list.
    static Configuration defaults();

    // Missing keys keep their defaults. Wrong types throw ScrubError(ConfigParse).
    static Configuration from_json(const nlohmann::json& document);
    nlohmann::json to_json() const;
};

std::vector<std::string> default_include_extensions();
std::vector<std::string> default_include_patterns();
std::vector<std::string> default_exclude_patterns();

Verbosity parse_verbosity(const std::string& text);
const char* verbosity_name(Verbosity verbosity);

// Explicit --config path: a missing or unreadable file is ScrubError(ConfigIo),
// malformed JSON is ScrubError(ConfigParse).
Configuration load_configuration(const std::filesystem::path& path);

// Default lookup: an absent file silently yields Configuration::defaults().
Configuration load_default_configuration(const std::filesystem::path& path = kDefaultConfigFile);

// Writes the configuration pretty-printed. Throws ScrubError(FileWrite).
void write_configuration(const std::filesystem::path& path, const Configuration& config);

// Prints a warning for each custom character that will be ignored and each
// exclude pattern that does not compile. Returns the number of warnings.
int report_configuration_warnings(const Configuration& config, const Console& console);

// Warns when only the legacy .ghostscrub file sits next to `default_path`.
// Returns true if it warned.
bool report_legacy_configuration(const std::filesystem::path& default_path, const Console& console);

} // namespace ghostscrub
