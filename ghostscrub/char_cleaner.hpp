#pragma once
/*
 * CharCleaner
 *
 * The text transform. Rules run in a fixed order, each on the output of the
 * previous one:
 *   1. zero-width family (U+200B U+200C U+200D U+FEFF) removed
 *   2. U+00A0 replaced by a plain space
 *   3. C0 controls and DEL removed, \n \r \t kept
 *   4. White_Space characters other than ' ' \n \r \t removed
 *   5. trailing whitespace trimmed per line (line endings become bare \n)
 *   6. custom code points removed, in configured order
 *   7. whitespace-only lines emptied (always on)
 * clean(clean(x)) == clean(x) for every x.
 */
#include <string>
#include <string_view>
#include <vector>

#include "ghostscrub/scrub_config.hpp"

namespace ghostscrub {

class CharCleaner {
public:
    explicit CharCleaner(const TargetCharacters& targets);

    // Input must be valid UTF-8, otherwise ScrubError(FileDecode).
    std::string clean(std::string_view content) const;

    // Custom entries that parsed; invalid ones are dropped silently.
    const std::vector<char32_t>& custom_code_points() const { return custom_code_points_; }

private:
    TargetCharacters targets_;
    std::vector<char32_t> custom_code_points_;
};

// One-shot convenience wrapper around CharCleaner.
std::string clean_content(std::string_view content, const TargetCharacters& targets);

// Reported change count: the drop in UTF-8 byte length. A ZWSP counts 3, and
// NBSP -> space counts 1 although one character changed.
std::size_t count_changes(std::string_view original, std::string_view cleaned);

// Splits on '\n' only. "a\n" gives {"a", ""}; "" gives {""}.
std::vector<std::string_view> split_lines(std::string_view text);

} // namespace ghostscrub
