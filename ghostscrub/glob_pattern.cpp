#include "ghostscrub/glob_pattern.hpp"

#include <algorithm>    // For std::sort

#include "ghostscrub/scrub_error.hpp"

namespace fs = std::filesystem;

namespace ghostscrub {

namespace {

bool is_regex_meta(char c) {
    switch (c) {
        case '.': case '^': case '$': case '|': case '(': case ')':
        case '[': case ']': case '{': case '}': case '+': case '\\':
        case '*': case '?':
            return true;
        default:
            return false;
    }
}

[[noreturn]] void glob_error(const std::string& pattern, const std::string& reason) {
    throw ScrubError(ErrorKind::GlobSyntax, "invalid glob pattern '" + pattern + "': " + reason, pattern);
}

// Translates a glob into an ECMAScript regex body. `recursive` is set when
// the pattern contains a "**" component.
std::string glob_to_regex(const std::string& original, std::string_view pattern, bool& recursive) {
    std::string regex_str;
    regex_str.reserve(pattern.size() * 2);
    recursive = false;

    std::size_t i = 0;
    while (i < pattern.size()) {
        const char c = pattern[i];

        if (c == '*' && i + 1 < pattern.size() && pattern[i + 1] == '*') {
            const bool starts_component = (i == 0 || pattern[i - 1] == '/');
            const bool ends_component = (i + 2 == pattern.size() || pattern[i + 2] == '/');
            if (!starts_component || !ends_component) {
                glob_error(original, "'**' must be a whole path component");
            }
            recursive = true;
            if (i + 2 < pattern.size()) {
                regex_str += "(?:.*/)?"; // "**/" : zero or more leading directories
                i += 3;
            } else if (!regex_str.empty() && regex_str.back() == '/') {
                regex_str.pop_back();    // "dir/**" : the directory itself or anything below it
                regex_str += "(?:/.*)?";
                i += 2;
            } else {
                regex_str += ".*";
                i += 2;
            }
            continue;
        }

        switch (c) {
            case '*':
                regex_str += "[^/]*";
                ++i;
                break;
            case '?':
                regex_str += "[^/]";
                ++i;
                break;
            case '[': {
                std::size_t j = i + 1;
                bool negate = false;
                if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
                    negate = true;
                    ++j;
                }
                std::string members;
                if (j < pattern.size() && pattern[j] == ']') { // leading ']' is literal
                    members += "\\]";
                    ++j;
                }
                while (j < pattern.size() && pattern[j] != ']') {
                    const char m = pattern[j];
                    if (m == '\\' || m == '[' || m == '^') members += '\\';
                    members += m;
                    ++j;
                }
                if (j >= pattern.size()) glob_error(original, "unterminated character class");
                regex_str += negate ? "[^/" : "[";
                regex_str += members;
                regex_str += ']';
                i = j + 1;
                break;
            }
            case '\\':
                if (i + 1 >= pattern.size()) glob_error(original, "trailing backslash");
                if (is_regex_meta(pattern[i + 1])) regex_str += '\\';
                regex_str += pattern[i + 1];
                i += 2;
                break;
            default:
                if (is_regex_meta(c)) regex_str += '\\';
                regex_str += c;
                ++i;
                break;
        }
    }
    return regex_str;
}

} // namespace

std::string_view strip_current_dir(std::string_view path) {
    while (path.size() >= 2 && path[0] == '.' && path[1] == '/') {
        path.remove_prefix(2);
        while (!path.empty() && path.front() == '/') path.remove_prefix(1);
    }
    return path;
}

bool has_glob_magic(std::string_view text) {
    return text.find_first_of("*?[") != std::string_view::npos;
}

GlobPattern::GlobPattern(const std::string& pattern) : pattern_(pattern) {
    const std::string regex_str = glob_to_regex(pattern, strip_current_dir(pattern), recursive_);
    try {
        regex_ = std::regex(regex_str, std::regex_constants::ECMAScript | std::regex_constants::optimize);
    } catch (const std::regex_error& e) {
        glob_error(pattern, std::string("regex '") + regex_str + "' rejected: " + e.what());
    }
}

std::optional<GlobPattern> GlobPattern::try_compile(const std::string& pattern) {
    try {
        return GlobPattern(pattern);
    } catch (const ScrubError&) {
        return std::nullopt;
    }
}

bool GlobPattern::matches(std::string_view path) const {
    const std::string_view body = strip_current_dir(path);
    return std::regex_match(body.begin(), body.end(), regex_);
}

bool GlobPattern::matches_path(const fs::path& path) const {
    return matches(std::string_view(path.generic_string()));
}

GlobExpansion expand_glob(const std::string& pattern) {
    const GlobPattern glob(pattern);
    GlobExpansion expansion;

    // Split into components; the literal leading ones become the walk root.
    const std::string_view body = strip_current_dir(pattern);
    std::vector<std::string> components;
    std::size_t start = 0;
    while (start <= body.size()) {
        std::size_t slash = body.find('/', start);
        if (slash == std::string_view::npos) slash = body.size();
        if (slash > start) components.emplace_back(body.substr(start, slash - start));
        start = slash + 1;
    }

    fs::path base = (!body.empty() && body.front() == '/') ? fs::path("/") : fs::path();
    std::size_t first_magic = 0;
    while (first_magic < components.size() && !has_glob_magic(components[first_magic])) {
        base /= components[first_magic];
        ++first_magic;
    }

    std::error_code ec;
    if (first_magic == components.size()) {
        // Nothing to expand: the pattern is a plain path.
        if (!base.empty() && fs::exists(base, ec)) expansion.matches.push_back(base);
        return expansion;
    }
    if (base.empty()) base = ".";
    if (!fs::is_directory(base, ec)) return expansion;

    // Without "**" a match can be at most this many levels below the root.
    const int max_depth = glob.is_recursive()
        ? -1
        : static_cast<int>(components.size() - first_magic) - 1;

    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        expansion.errors.push_back(base.string() + ": " + ec.message());
        return expansion;
    }
    const fs::recursive_directory_iterator end{};
    while (it != end) {
        if (max_depth >= 0 && it.depth() >= max_depth) it.disable_recursion_pending();

        const std::string candidate = it->path().generic_string();
        if (glob.matches(candidate)) {
            expansion.matches.emplace_back(std::string(strip_current_dir(candidate)));
        }

        it.increment(ec);
        if (ec) {
            expansion.errors.push_back(candidate + ": " + ec.message());
            break;
        }
    }

    std::sort(expansion.matches.begin(), expansion.matches.end());
    return expansion;
}

} // namespace ghostscrub
