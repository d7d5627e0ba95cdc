#pragma once
/*
 * GlobPattern
 *
 * Shell-style path patterns compiled to std::regex.
 *   *      any run of characters inside one path component
 *   ?      one character other than '/'
 *   [...]  character class, [!...] or [^...] negated
 *   **     zero or more whole components ("a/**" also matches "a" itself)
 * A leading "./" on either the pattern or the path is ignored.
 */
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace ghostscrub {

class GlobPattern {
public:
    // Throws ScrubError(ErrorKind::GlobSyntax) for malformed patterns.
    explicit GlobPattern(const std::string& pattern);

    // Same, but std::nullopt instead of throwing.
    static std::optional<GlobPattern> try_compile(const std::string& pattern);

    bool matches(std::string_view path) const;
    bool matches_path(const std::filesystem::path& path) const;

    const std::string& pattern() const { return pattern_; }
    bool is_recursive() const { return recursive_; }

private:
    std::string pattern_;
    std::regex regex_;
    bool recursive_ = false;
};

// True if the text contains any of * ? [
bool has_glob_magic(std::string_view text);

// Strips any number of leading "./" segments.
std::string_view strip_current_dir(std::string_view path);

struct GlobExpansion {
    std::vector<std::filesystem::path> matches; // sorted
    std::vector<std::string> errors;            // unreadable directories met while enumerating
};

// Enumerates the filesystem for paths matching `pattern`. Walks from the
// longest literal leading directory; the walk is depth-bounded unless the
// pattern contains "**". Throws ScrubError(GlobSyntax) for malformed patterns.
GlobExpansion expand_glob(const std::string& pattern);

} // namespace ghostscrub
