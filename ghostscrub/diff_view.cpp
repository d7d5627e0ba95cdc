#include "ghostscrub/diff_view.hpp"

#include <algorithm>    // For std::max
#include <sstream>

#include "ghostscrub/char_cleaner.hpp"
#include "ghostscrub/unicode_utils.hpp"

namespace ghostscrub {

namespace {

// ⦃ and ⦄ (U+2983, U+2984) bracket every tag.
const char* const kOpen = u8"\u2983";
const char* const kClose = u8"\u2984";

std::string bracket(const std::string& body) {
    return std::string(kOpen) + body + kClose;
}

std::string inline_tag(char32_t cp) {
    switch (cp) {
        case 0x200B: return bracket("ZWS");
        case 0x200C: return bracket("ZWNJ");
        case 0x200D: return bracket("ZWJ");
        case 0xFEFF: return bracket("BOM");
        case 0x00A0: return bracket("NBSP");
        case U'\t':  return bracket("TAB");
        case U' ':   return " ";
        default: break;
    }
    if (unicode::is_control(cp) && cp != U'\n' && cp != U'\r') {
        return bracket(unicode::format_code_point(cp));
    }
    if (unicode::is_whitespace(cp) && cp != U'\n' && cp != U'\r') {
        return bracket("WS:" + unicode::format_code_point(cp));
    }
    std::string plain;
    unicode::append_utf8(plain, cp);
    return plain;
}

std::string join_short_tags(std::u32string_view chars) {
    std::string out;
    for (std::size_t i = 0; i < chars.size(); ++i) {
        if (i > 0) out += '+';
        out += short_tag(chars[i]);
    }
    return out;
}

} // namespace

std::vector<LineChange> changed_lines(std::string_view original, std::string_view cleaned) {
    const auto original_lines = split_lines(original);
    const auto cleaned_lines = split_lines(cleaned);
    const std::size_t max_lines = std::max(original_lines.size(), cleaned_lines.size());

    std::vector<LineChange> changes;
    for (std::size_t i = 0; i < max_lines; ++i) {
        const std::string_view before = i < original_lines.size() ? original_lines[i] : std::string_view();
        const std::string_view after = i < cleaned_lines.size() ? cleaned_lines[i] : std::string_view();
        if (before != after) changes.push_back({i + 1, before, after});
    }
    return changes;
}

std::string short_tag(char32_t cp) {
    switch (cp) {
        case U' ':   return "SP";
        case U'\t':  return "TAB";
        case 0x00A0: return "NBSP";
        default: break;
    }
    if (unicode::is_whitespace(cp)) return "WS:" + unicode::format_code_point(cp);
    return unicode::format_code_point(cp);
}

std::string visualize_invisible_chars(std::string_view line) {
    if (line.empty()) return bracket("EMPTY");

    auto decoded = unicode::decode_utf8(line);
    if (!decoded) return std::string(line); // not text; show as-is
    const std::u32string& chars = *decoded;

    if (unicode::trim(line).empty()) {
        return bracket("WHITESPACE-ONLY: " + join_short_tags(chars));
    }

    std::size_t content_end = chars.size();
    while (content_end > 0 && unicode::is_whitespace(chars[content_end - 1])) --content_end;

    std::string rendered;
    for (std::size_t i = 0; i < content_end; ++i) rendered += inline_tag(chars[i]);

    if (content_end < chars.size()) {
        const std::u32string_view trailing = std::u32string_view(chars).substr(content_end);
        rendered += bracket("TRAILING: " + join_short_tags(trailing));
    }
    return rendered;
}

std::string render_diff_report(const std::string& path,
                               std::string_view original,
                               std::string_view cleaned,
                               std::size_t changes,
                               bool dry_run) {
    std::ostringstream report;
    report << (dry_run ? "Would clean " : "Cleaned ") << changes
           << " invisible characters from: " << path << '\n';

    const auto diff = changed_lines(original, cleaned);
    if (diff.empty()) return report.str();

    report << "--- Original\n";
    report << "+++ Cleaned\n";
    for (const auto& change : diff) {
        report << '-' << change.line_number << ": " << visualize_invisible_chars(change.original) << '\n';
        report << '+' << change.line_number << ": " << visualize_invisible_chars(change.cleaned) << '\n';
    }
    report << '\n';
    return report.str();
}

} // namespace ghostscrub
