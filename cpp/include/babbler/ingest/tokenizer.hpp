#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace babbler::ingest {

enum class TokenClass {
    LETTER,
    DIGIT,
    SPACE,
    OTHER
};

TokenClass classify(uint32_t codepoint);

/**
 * Split text into chain tokens: maximal runs of letters, of ASCII digits or
 * of whitespace, and single code points for everything else. Concatenating
 * the tokens gives back the input bytes.
 */
std::vector<std::string> tokenize(const std::string& text);

} // namespace babbler::ingest
