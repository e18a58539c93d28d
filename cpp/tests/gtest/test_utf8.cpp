// =============================================================================
// UTF-8 Utility Tests
// =============================================================================

#include <gtest/gtest.h>
#include "babbler/util/utf8.hpp"
#include <string>
#include <vector>

using namespace babbler::util;

namespace {

std::vector<uint32_t> codepoints(const std::string& text) {
    std::vector<uint32_t> cps;
    size_t pos = 0;
    while (pos < text.size()) {
        cps.push_back(next_codepoint(text, pos));
    }
    return cps;
}

} // namespace

TEST(Utf8Test, DecodeEncodeRoundTrip) {
    const std::string text = "aä€😀";
    std::vector<uint32_t> cps = codepoints(text);
    ASSERT_EQ(cps.size(), 4u);
    EXPECT_EQ(cps[0], 0x61u);
    EXPECT_EQ(cps[1], 0xE4u);
    EXPECT_EQ(cps[2], 0x20ACu);
    EXPECT_EQ(cps[3], 0x1F600u);

    std::string rebuilt;
    for (uint32_t cp : cps) rebuilt += encode_utf8(cp);
    EXPECT_EQ(rebuilt, text);
}

TEST(Utf8Test, InvalidBytesBecomeReplacement) {
    std::vector<uint32_t> cps = codepoints(std::string("a\xFF" "b"));
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[1], 0xFFFDu);
    EXPECT_EQ(cps[2], static_cast<uint32_t>('b'));
}

TEST(Utf8Test, TruncatedSequenceConsumesOneByte) {
    const std::string text("\xE2\x82", 2);
    size_t pos = 0;
    EXPECT_EQ(next_codepoint(text, pos), 0xFFFDu);
    EXPECT_EQ(pos, 1u);
}

TEST(Utf8Test, LowercaseAscii) {
    EXPECT_EQ(to_lower_utf8("Hello, WORLD 42"), "hello, world 42");
}

TEST(Utf8Test, LowercaseLatinGreekCyrillic) {
    EXPECT_EQ(to_lower_utf8("ÅÄÖ"), "åäö");
    EXPECT_EQ(to_lower_utf8("ŁÓDŹ"), "łódź");
    EXPECT_EQ(to_lower_utf8("ΑΘΗΝΑ"), "αθηνα");
    EXPECT_EQ(to_lower_utf8("МОСКВА"), "москва");
    EXPECT_EQ(to_lower_utf8("×"), "×");
}

TEST(Utf8Test, LowercaseKeepsMalformedBytes) {
    const std::string malformed("A\xC3", 2);
    EXPECT_EQ(to_lower_utf8(malformed), std::string("a\xC3", 2));
}
