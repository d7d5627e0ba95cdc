#pragma once
/*
 * Unicode helpers
 *
 * UTF-8 <-> code point conversion and the two character classes the cleaner
 * cares about (White_Space and Cc). Text is kept as UTF-8 std::string
 * everywhere; std::u32string is only used while a rule walks characters.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ghostscrub::unicode {

// Strict decode. Returns std::nullopt on any malformed sequence
// (truncated, overlong, surrogate, above U+10FFFF).
std::optional<std::u32string> decode_utf8(std::string_view in);

bool is_valid_utf8(std::string_view in);

void append_utf8(std::string& out, char32_t cp);
std::string encode_utf8(std::u32string_view in);

// Unicode White_Space property.
bool is_whitespace(char32_t cp);

// General category Cc (C0, DEL, C1).
bool is_control(char32_t cp);

bool is_scalar_value(std::uint32_t cp);

// Right/both-side trim of White_Space characters, UTF-8 aware.
std::string_view trim_end(std::string_view in);
std::string_view trim(std::string_view in);

// Parses "U+200B", "200b" and the like. std::nullopt for anything that is not
// 1-8 hex digits naming a scalar value.
std::optional<char32_t> parse_code_point(std::string_view text);

// "U+00A0" style: upper-case hex, at least four digits.
std::string format_code_point(char32_t cp);

} // namespace ghostscrub::unicode
