#pragma once
/*
 * Diff view
 *
 * Line-aligned report of what the cleaner changed, with invisible characters
 * spelled out as tags. Depends only on (original, cleaned); no state.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ghostscrub {

struct LineChange {
    std::size_t line_number;       // 1-based
    std::string_view original;     // "" when the original has fewer lines
    std::string_view cleaned;      // "" when the cleaned text has fewer lines
};

// Pairs lines by index up to the longer of the two texts and keeps the
// indices where they differ.
std::vector<LineChange> changed_lines(std::string_view original, std::string_view cleaned);

// "SP", "TAB", "NBSP", "WS:U+2003", or "U+200B".
std::string short_tag(char32_t cp);

// Renders one line:
//   whitespace-only  -> ⦃WHITESPACE-ONLY: SP+TAB⦄
//   empty            -> ⦃EMPTY⦄
//   otherwise inline tags (⦃ZWS⦄, ⦃NBSP⦄, ⦃U+0007⦄, ...), with any trailing
//   whitespace listed in a ⦃TRAILING: ...⦄ marker.
std::string visualize_invisible_chars(std::string_view line);

// Full verbose report: header, ---/+++ lines, -N:/+N: pairs, blank line.
std::string render_diff_report(const std::string& path,
                               std::string_view original,
                               std::string_view cleaned,
                               std::size_t changes,
                               bool dry_run);

} // namespace ghostscrub
