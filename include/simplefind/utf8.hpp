#pragma once
#include <cstddef>
#include <string_view>

/// Rejects truncated sequences, overlong forms, surrogates and code points
/// above U+10FFFF
bool is_valid_utf8(std::string_view s);

/// Number of Unicode scalar values in a UTF-8 string
std::size_t utf8_length(std::string_view s);

/// Byte offset of the character at index `characters` (clamped to s.size())
std::size_t utf8_byte_offset(std::string_view s, std::size_t characters);
