#pragma once
/*
 * PathFilter
 *
 * The one place that decides whether a path is in scope.
 *   should_process : extension allow/deny lists (applied by FileProcessor)
 *   is_excluded    : configurable exclude globs (applied while walking and
 *                    to watch events). The built-in VCS/build/editor skip list
 *                    is just the default value of those globs.
 */
#include <filesystem>
#include <string>
#include <vector>

#include "ghostscrub/glob_pattern.hpp"
#include "ghostscrub/scrub_config.hpp"

namespace ghostscrub {

class PathFilter {
public:
    explicit PathFilter(const Configuration& config);

    // Deny-list wins over allow-list; extensionless paths always pass.
    bool should_process(const std::filesystem::path& path) const;

    // True if the path matches any exclude pattern. Malformed patterns were
    // dropped at construction and never match.
    bool is_excluded(const std::filesystem::path& path) const;

    const std::vector<std::string>& rejected_patterns() const { return rejected_patterns_; }

private:
    std::vector<std::string> include_extensions_;
    std::vector<std::string> exclude_extensions_;
    std::vector<GlobPattern> exclude_patterns_;
    std::vector<std::string> rejected_patterns_;
};

// Extension rule without building a filter.
bool should_process(const std::filesystem::path& path, const Configuration& config);

// Dotfiles, "~" backups, .tmp/.swp files and emacs ".#" lock files that
// editors create while saving.
bool is_editor_artifact(const std::filesystem::path& path);

} // namespace ghostscrub
