#pragma once

#include <cstdint>
#include <string>

namespace babbler::util {

// Decode one code point starting at `pos` and advance `pos` past it.
// Invalid or truncated sequences yield U+FFFD and consume a single byte.
uint32_t next_codepoint(const std::string& data, size_t& pos);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

// Simple (one-to-one) lowercase mapping for Latin, Greek and Cyrillic
uint32_t to_lower(uint32_t codepoint);

// Lowercase a UTF-8 string; malformed bytes are passed through unchanged
std::string to_lower_utf8(const std::string& text);

} // namespace babbler::util
