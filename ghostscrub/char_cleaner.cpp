#include "ghostscrub/char_cleaner.hpp"

#include <algorithm>    // For std::remove_if, std::replace

#include "ghostscrub/scrub_error.hpp"
#include "ghostscrub/unicode_utils.hpp"

namespace ghostscrub {

namespace {

bool is_zero_width(char32_t cp) {
    return cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0xFEFF;
}

bool is_kept_layout_char(char32_t cp) {
    return cp == U'\n' || cp == U'\r' || cp == U'\t';
}

template <typename Pred>
void erase_if(std::u32string& text, Pred pred) {
    text.erase(std::remove_if(text.begin(), text.end(), pred), text.end());
}

// Applies `line_op` to every '\n'-separated line and rejoins with '\n'.
template <typename LineOp>
std::u32string map_lines(const std::u32string& text, LineOp line_op) {
    std::u32string result;
    result.reserve(text.size());
    std::size_t start = 0;
    while (true) {
        std::size_t end = text.find(U'\n', start);
        const bool last = (end == std::u32string::npos);
        if (last) end = text.size();
        result += line_op(std::u32string_view(text).substr(start, end - start));
        if (last) break;
        result += U'\n';
        start = end + 1;
    }
    return result;
}

std::u32string_view trim_end_u32(std::u32string_view line) {
    std::size_t keep = line.size();
    while (keep > 0 && unicode::is_whitespace(line[keep - 1])) --keep;
    return line.substr(0, keep);
}

} // namespace

CharCleaner::CharCleaner(const TargetCharacters& targets) : targets_(targets) {
    for (const auto& entry : targets_.custom_chars) {
        if (auto cp = unicode::parse_code_point(entry)) custom_code_points_.push_back(*cp);
    }
}

std::string CharCleaner::clean(std::string_view content) const {
    auto decoded = unicode::decode_utf8(content);
    if (!decoded) {
        throw ScrubError(ErrorKind::FileDecode, "content is not valid UTF-8 text");
    }
    std::u32string text = std::move(*decoded);

    if (targets_.zero_width_spaces) {
        erase_if(text, is_zero_width);
    }

    if (targets_.non_breaking_spaces) {
        std::replace(text.begin(), text.end(), char32_t{0x00A0}, char32_t{U' '});
    }

    if (targets_.control_characters) {
        erase_if(text, [](char32_t cp) {
            return !is_kept_layout_char(cp) && (cp <= 0x1F || cp == 0x7F);
        });
    }

    if (targets_.unicode_whitespace) {
        erase_if(text, [](char32_t cp) {
            return cp != U' ' && !is_kept_layout_char(cp) && unicode::is_whitespace(cp);
        });
    }

    auto trim_trailing = [](const std::u32string& in) {
        // '\r' before '\n' is whitespace too, so CRLF collapses to LF here.
        return map_lines(in, [](std::u32string_view line) {
            return std::u32string(trim_end_u32(line));
        });
    };

    if (targets_.trailing_whitespace) {
        text = trim_trailing(text);
    }

    const std::size_t before_custom = text.size();
    for (char32_t cp : custom_code_points_) {
        erase_if(text, [cp](char32_t c) { return c == cp; });
    }
    // "a x" with custom 'x' leaves "a ": trim again or a second run would differ.
    if (targets_.trailing_whitespace && text.size() != before_custom) {
        text = trim_trailing(text);
    }

    // Whitespace-only lines become empty lines (not removed).
    text = map_lines(text, [](std::u32string_view line) {
        if (!line.empty() && trim_end_u32(line).empty()) return std::u32string();
        return std::u32string(line);
    });

    return unicode::encode_utf8(text);
}

std::string clean_content(std::string_view content, const TargetCharacters& targets) {
    return CharCleaner(targets).clean(content);
}

std::size_t count_changes(std::string_view original, std::string_view cleaned) {
    return original.size() > cleaned.size() ? original.size() - cleaned.size() : 0;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (true) {
        const std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

} // namespace ghostscrub
