#include <gtest/gtest.h>

#include <string>

#include "error.h"
#include "utf8.h"

using namespace unicsv;

// ============================================================================
// Decoding
// ============================================================================

TEST(Utf8DecodeTest, DecodesEachSequenceLength) {
    std::string text = "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
    char32_t cp = 0;
    size_t pos = 0;

    EXPECT_EQ(utf8_decode(text, pos, cp), 1u);
    EXPECT_EQ(cp, U'A');
    pos += 1;
    EXPECT_EQ(utf8_decode(text, pos, cp), 2u);
    EXPECT_EQ(cp, 0xE9u);
    pos += 2;
    EXPECT_EQ(utf8_decode(text, pos, cp), 3u);
    EXPECT_EQ(cp, 0x20ACu);
    pos += 3;
    EXPECT_EQ(utf8_decode(text, pos, cp), 4u);
    EXPECT_EQ(cp, 0x1F600u);
}

TEST(Utf8DecodeTest, RejectsMalformedSequences) {
    char32_t cp = 0;
    EXPECT_EQ(utf8_decode("\x80", 0, cp), 0u) << "Stray continuation byte";
    EXPECT_EQ(utf8_decode("\xC3", 0, cp), 0u) << "Truncated sequence";
    EXPECT_EQ(utf8_decode("\xC0\xAF", 0, cp), 0u) << "Overlong encoding";
    EXPECT_EQ(utf8_decode("\xED\xA0\x80", 0, cp), 0u) << "Encoded surrogate";
    EXPECT_EQ(utf8_decode("\xF4\x90\x80\x80", 0, cp), 0u) << "Beyond U+10FFFF";
}

TEST(Utf8DecodeTest, FromUtf8ThrowsWithOffset) {
    try {
        from_utf8("ab\xFF");
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_UTF8);
        EXPECT_EQ(e.error().offset, 2u);
    }
}

// ============================================================================
// Encoding
// ============================================================================

TEST(Utf8EncodeTest, AppendReportsLength) {
    std::string out;
    EXPECT_EQ(utf8_append(out, U'A'), 1u);
    EXPECT_EQ(utf8_append(out, 0xE9), 2u);
    EXPECT_EQ(utf8_append(out, 0x1F600), 4u);
    EXPECT_EQ(out, "A\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(Utf8EncodeTest, AppendRejectsNonScalars) {
    std::string out;
    EXPECT_EQ(utf8_append(out, 0xD800), 0u);
    EXPECT_EQ(utf8_append(out, 0x110000), 0u);
    EXPECT_TRUE(out.empty());
}

TEST(Utf8EncodeTest, ConvertsBothWays) {
    std::u32string scalars = U"héllo 日本";
    EXPECT_EQ(from_utf8(to_utf8(scalars)), scalars);
}

TEST(Utf8EncodeTest, EscapeScalarsShowsControls) {
    EXPECT_EQ(escape_scalars(U"\r\n"), "\\r\\n");
    EXPECT_EQ(escape_scalars(U"a\tb"), "a\\tb");
    EXPECT_EQ(escape_scalars(U","), ",");
}

TEST(Utf8ScalarTest, IsUnicodeScalar) {
    EXPECT_TRUE(is_unicode_scalar(0));
    EXPECT_TRUE(is_unicode_scalar(0x10FFFF));
    EXPECT_FALSE(is_unicode_scalar(0xDFFF));
    EXPECT_FALSE(is_unicode_scalar(0x110000));
}
