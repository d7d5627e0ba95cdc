#include "ghostscrub/unicode_utils.hpp"

#include <cstdio>       // For std::snprintf

namespace ghostscrub::unicode {

namespace {

// Reads one code point starting at `pos`, advancing `pos`.
// Returns false (and leaves `pos` untouched) on a malformed sequence.
bool read_code_point(std::string_view in, std::size_t& pos, char32_t& cp) {
    const auto lead = static_cast<unsigned char>(in[pos]);
    std::size_t length = 0;
    char32_t value = 0;
    char32_t min_value = 0;

    if (lead < 0x80) {
        cp = lead;
        ++pos;
        return true;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2; value = lead & 0x1F; min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; value = lead & 0x0F; min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; value = lead & 0x07; min_value = 0x10000;
    } else {
        return false; // stray continuation byte or 0xF8..0xFF
    }

    if (pos + length > in.size()) return false;
    for (std::size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(in[pos + i]);
        if ((byte & 0xC0) != 0x80) return false;
        value = (value << 6) | (byte & 0x3F);
    }
    if (value < min_value || !is_scalar_value(value)) return false;

    cp = value;
    pos += length;
    return true;
}

} // namespace

std::optional<std::u32string> decode_utf8(std::string_view in) {
    std::u32string out;
    out.reserve(in.size());
    std::size_t pos = 0;
    while (pos < in.size()) {
        char32_t cp = 0;
        if (!read_code_point(in, pos, cp)) return std::nullopt;
        out.push_back(cp);
    }
    return out;
}

bool is_valid_utf8(std::string_view in) {
    std::size_t pos = 0;
    char32_t cp = 0;
    while (pos < in.size()) {
        if (!read_code_point(in, pos, cp)) return false;
    }
    return true;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string encode_utf8(std::u32string_view in) {
    std::string out;
    out.reserve(in.size());
    for (char32_t cp : in) append_utf8(out, cp);
    return out;
}

bool is_whitespace(char32_t cp) {
    switch (cp) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020:
        case 0x0085:
        case 0x00A0:
        case 0x1680:
        case 0x2028: case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool is_control(char32_t cp) {
    return cp <= 0x1F || (cp >= 0x7F && cp <= 0x9F);
}

bool is_scalar_value(std::uint32_t cp) {
    return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
}

std::string_view trim_end(std::string_view in) {
    std::size_t pos = 0;
    std::size_t keep = 0; // byte offset just past the last non-whitespace character
    while (pos < in.size()) {
        char32_t cp = 0;
        if (!read_code_point(in, pos, cp)) {
            ++pos;        // malformed byte counts as content
            keep = pos;
            continue;
        }
        if (!is_whitespace(cp)) keep = pos;
    }
    return in.substr(0, keep);
}

std::string_view trim(std::string_view in) {
    std::size_t pos = 0;
    while (pos < in.size()) {
        std::size_t next = pos;
        char32_t cp = 0;
        if (!read_code_point(in, next, cp) || !is_whitespace(cp)) break;
        pos = next;
    }
    return trim_end(in.substr(pos));
}

std::optional<char32_t> parse_code_point(std::string_view text) {
    if (text.size() >= 2 && text.substr(0, 2) == "U+") text.remove_prefix(2);
    if (text.empty() || text.size() > 8) return std::nullopt;

    std::uint32_t value = 0;
    for (char c : text) {
        std::uint32_t digit = 0;
        if (c >= '0' && c <= '9') digit = static_cast<std::uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') digit = static_cast<std::uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') digit = static_cast<std::uint32_t>(c - 'A' + 10);
        else return std::nullopt;
        value = (value << 4) | digit;
    }
    if (!is_scalar_value(value)) return std::nullopt;
    return static_cast<char32_t>(value);
}

std::string format_code_point(char32_t cp) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<unsigned>(cp));
    return buffer;
}

} // namespace ghostscrub::unicode
