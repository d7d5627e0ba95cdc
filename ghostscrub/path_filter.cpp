#include "ghostscrub/path_filter.hpp"

#include <algorithm>    // For std::find, std::any_of
#include <utility>      // For std::move

namespace fs = std::filesystem;

namespace ghostscrub {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

bool extension_allowed(const fs::path& path,
                       const std::vector<std::string>& include_extensions,
                       const std::vector<std::string>& exclude_extensions) {
    std::string extension = path.extension().string();
    if (extension.empty()) return true; // no extension: rule does not apply
    extension.erase(0, 1);              // drop the leading '.'

    if (!exclude_extensions.empty() && contains(exclude_extensions, extension)) return false;
    if (!include_extensions.empty() && !contains(include_extensions, extension)) return false;
    return true;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

PathFilter::PathFilter(const Configuration& config)
    : include_extensions_(config.include_extensions),
      exclude_extensions_(config.exclude_extensions) {
    for (const auto& pattern : config.exclude_patterns) {
        if (auto compiled = GlobPattern::try_compile(pattern)) {
            exclude_patterns_.push_back(std::move(*compiled));
        } else {
            rejected_patterns_.push_back(pattern);
        }
    }
}

bool PathFilter::should_process(const fs::path& path) const {
    return extension_allowed(path, include_extensions_, exclude_extensions_);
}

bool PathFilter::is_excluded(const fs::path& path) const {
    const std::string path_str = path.generic_string();
    return std::any_of(exclude_patterns_.begin(), exclude_patterns_.end(),
                       [&path_str](const GlobPattern& glob) { return glob.matches(path_str); });
}

bool should_process(const fs::path& path, const Configuration& config) {
    return extension_allowed(path, config.include_extensions, config.exclude_extensions);
}

bool is_editor_artifact(const fs::path& path) {
    const std::string name = path.filename().string();
    if (name.empty()) return false;
    return name.front() == '.' ||
           ends_with(name, "~") ||
           ends_with(name, ".tmp") ||
           ends_with(name, ".swp") ||
           name.find(".#") != std::string::npos;
}

} // namespace ghostscrub
