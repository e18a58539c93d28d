#include "babbler/ingest/tokenizer.hpp"
#include "babbler/util/utf8.hpp"

namespace babbler::ingest {

namespace {

bool is_space(uint32_t cp) {
    switch (cp) {
        case ' ': case '\t': case '\n': case '\r': case '\f': case '\v':
        case 0x00A0: case 0x1680: case 0x2028: case 0x2029:
        case 0x202F: case 0x205F: case 0x3000: case 0xFEFF:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool is_symbol(uint32_t cp) {
    return (cp >= 0x00A1 && cp <= 0x00BF) ||
           cp == 0x00D7 || cp == 0x00F7 ||
           (cp >= 0x2000 && cp <= 0x206F) ||    // General Punctuation
           (cp >= 0x3000 && cp <= 0x303F) ||    // CJK Symbols and Punctuation
           cp == 0xFFFD;
}

} // namespace

TokenClass classify(uint32_t cp) {
    if (is_space(cp)) return TokenClass::SPACE;
    if (cp >= '0' && cp <= '9') return TokenClass::DIGIT;
    if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) return TokenClass::LETTER;
    if (cp >= 0x80 && !is_symbol(cp)) return TokenClass::LETTER;
    return TokenClass::OTHER;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;

    size_t pos = 0;
    size_t start = 0;
    bool open = false;
    TokenClass current = TokenClass::OTHER;

    while (pos < text.size()) {
        const size_t cp_start = pos;
        const TokenClass cls = classify(util::next_codepoint(text, pos));

        const bool extends = open && cls == current && cls != TokenClass::OTHER;
        if (!extends) {
            if (open) tokens.emplace_back(text, start, cp_start - start);
            start = cp_start;
            current = cls;
            open = true;
        }
    }

    if (open) tokens.emplace_back(text, start, text.size() - start);
    return tokens;
}

} // namespace babbler::ingest
