#include "babbler/util/utf8.hpp"

namespace babbler::util {

namespace {

constexpr uint32_t REPLACEMENT = 0xFFFD;

bool is_continuation(uint8_t b) { return (b & 0xC0) == 0x80; }

// Lowercase within ranges where upper/lower alternate as even/odd pairs
bool in_pair_range(uint32_t cp, uint32_t first, uint32_t last) {
    return cp >= first && cp <= last && ((cp - first) % 2 == 0);
}

} // namespace

uint32_t next_codepoint(const std::string& data, size_t& pos) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
    const size_t n = data.size();
    const uint8_t b0 = p[pos];

    if (b0 < 0x80) {
        ++pos;
        return b0;
    }

    size_t len = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if ((b0 & 0xE0) == 0xC0)      { len = 2; cp = b0 & 0x1F; min_cp = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min_cp = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min_cp = 0x10000; }
    else {
        ++pos;
        return REPLACEMENT;
    }

    if (pos + len > n) {
        ++pos;
        return REPLACEMENT;
    }

    for (size_t i = 1; i < len; ++i) {
        if (!is_continuation(p[pos + i])) {
            ++pos;
            return REPLACEMENT;
        }
        cp = (cp << 6) | (p[pos + i] & 0x3F);
    }

    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++pos;
        return REPLACEMENT;
    }

    pos += len;
    return cp;
}

std::string encode_utf8(uint32_t codepoint) {
    std::string result;

    if (codepoint < 0x80) {
        result += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        result += static_cast<char>(0xC0 | (codepoint >> 6));
        result += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        result += static_cast<char>(0xE0 | (codepoint >> 12));
        result += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x110000) {
        result += static_cast<char>(0xF0 | (codepoint >> 18));
        result += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (codepoint & 0x3F));
    }

    return result;
}

uint32_t to_lower(uint32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + 32 : cp;
    }

    // Latin-1 Supplement (U+00D7 is the multiplication sign)
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 32;

    // Latin Extended-A
    if (in_pair_range(cp, 0x0100, 0x012E)) return cp + 1;
    if (in_pair_range(cp, 0x0132, 0x0136)) return cp + 1;
    if (cp >= 0x0139 && cp <= 0x0147 && (cp % 2 == 1)) return cp + 1;
    if (in_pair_range(cp, 0x014A, 0x0176)) return cp + 1;
    if (cp == 0x0178) return 0x00FF;
    if (cp >= 0x0179 && cp <= 0x017D && (cp % 2 == 1)) return cp + 1;

    // Greek
    if (cp == 0x0386) return 0x03AC;
    if (cp >= 0x0388 && cp <= 0x038A) return cp + 37;
    if (cp == 0x038C) return 0x03CC;
    if (cp == 0x038E || cp == 0x038F) return cp + 63;
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 32;

    // Cyrillic
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 80;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 32;
    if (in_pair_range(cp, 0x0460, 0x0480)) return cp + 1;
    if (in_pair_range(cp, 0x048A, 0x04BE)) return cp + 1;
    if (cp >= 0x04C1 && cp <= 0x04CD && (cp % 2 == 1)) return cp + 1;
    if (in_pair_range(cp, 0x04D0, 0x04FE)) return cp + 1;

    return cp;
}

std::string to_lower_utf8(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        const uint8_t b = static_cast<uint8_t>(text[pos]);
        if (b < 0x80) {
            result += static_cast<char>((b >= 'A' && b <= 'Z') ? b + 32 : b);
            ++pos;
            continue;
        }

        const size_t start = pos;
        const uint32_t cp = next_codepoint(text, pos);
        if (cp == REPLACEMENT && pos == start + 1) {
            result += text[start];
            continue;
        }
        result += encode_utf8(to_lower(cp));
    }

    return result;
}

} // namespace babbler::util
