#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "error.h"
#include "scalar_source.h"

using namespace unicsv;

namespace {

std::u32string drain(ScalarSource& source) {
    std::u32string out;
    while (auto c = source.next()) out.push_back(*c);
    return out;
}

std::string bytes(std::initializer_list<unsigned char> list) {
    return std::string(list.begin(), list.end());
}

}  // namespace

// ============================================================================
// Utf8Source
// ============================================================================

TEST(Utf8SourceTest, DecodesMixedText) {
    Utf8Source source("a,\xC3\xA9\n\xE6\x97\xA5");
    EXPECT_EQ(drain(source), U"a,é\n日");
}

TEST(Utf8SourceTest, SkipsByteOrderMark) {
    Utf8Source source("\xEF\xBB\xBFx");
    EXPECT_EQ(drain(source), U"x");
}

TEST(Utf8SourceTest, LongAsciiRunsCrossWindows) {
    std::string text(1000, 'a');
    text += "\xC3\xA9";
    text += std::string(700, 'b');
    Utf8Source source(text);
    std::u32string out = drain(source);
    ASSERT_EQ(out.size(), 1701u);
    EXPECT_EQ(out[999], U'a');
    EXPECT_EQ(out[1000], 0xE9u);
    EXPECT_EQ(out[1001], U'b');
}

TEST(Utf8SourceTest, InvalidByteReportsOffset) {
    Utf8Source source("ab\xFF" "c");
    EXPECT_EQ(*source.next(), U'a');
    EXPECT_EQ(*source.next(), U'b');
    try {
        source.next();
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_UTF8);
        EXPECT_EQ(e.error().offset, 2u);
        EXPECT_EQ(error_category(e.code()), ErrorCategory::MALFORMED_INPUT);
    }
}

// ============================================================================
// Utf16Source / Utf32Source
// ============================================================================

TEST(Utf16SourceTest, BigAndLittleEndian) {
    Utf16Source be(bytes({0x00, 'A', 0x00, ','}), true);
    EXPECT_EQ(drain(be), U"A,");
    Utf16Source le(bytes({'A', 0x00, ',', 0x00}), false);
    EXPECT_EQ(drain(le), U"A,");
}

TEST(Utf16SourceTest, CombinesSurrogatePairs) {
    // U+1F600 is D83D DE00
    Utf16Source source(bytes({0xD8, 0x3D, 0xDE, 0x00}), true);
    EXPECT_EQ(drain(source), U"\U0001F600");
}

TEST(Utf16SourceTest, UnpairedSurrogateThrows) {
    Utf16Source source(bytes({0xDC, 0x00, 0x00, 'A'}), true);
    EXPECT_THROW(source.next(), CsvException);
}

TEST(Utf16SourceTest, OddTrailingByteThrows) {
    Utf16Source source(bytes({0x00, 'A', 0x00}), true);
    EXPECT_EQ(*source.next(), U'A');
    try {
        source.next();
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_UTF16);
    }
}

TEST(Utf32SourceTest, DecodesBothByteOrders) {
    Utf32Source be(bytes({0x00, 0x00, 0x00, 'A', 0x00, 0x01, 0xF6, 0x00}), true);
    EXPECT_EQ(drain(be), U"A\U0001F600");
    Utf32Source le(bytes({'A', 0x00, 0x00, 0x00}), false);
    EXPECT_EQ(drain(le), U"A");
}

TEST(Utf32SourceTest, RejectsNonScalars) {
    Utf32Source source(bytes({0x00, 0x11, 0x00, 0x00}), true);
    try {
        source.next();
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_UTF32);
        ASSERT_TRUE(e.error().scalar.has_value());
        EXPECT_EQ(*e.error().scalar, 0x110000u);
    }
}

// ============================================================================
// make_source
// ============================================================================

TEST(MakeSourceTest, PicksSourceFromBom) {
    auto source = make_source(bytes({0xFF, 0xFE, 'x', 0x00, ',', 0x00}));
    EXPECT_EQ(drain(*source), U"x,");
}

TEST(MakeSourceTest, Utf32BomIsSkipped) {
    auto source = make_source(bytes({0x00, 0x00, 0xFE, 0xFF, 0x00, 0x00, 0x00, 'q'}));
    EXPECT_EQ(drain(*source), U"q");
}

TEST(MakeSourceTest, DefaultsToUtf8) {
    auto source = make_source("h\xC3\xA9");
    EXPECT_EQ(drain(*source), U"hé");
}

TEST(MakeSourceTest, ExplicitUtf16DefaultsToBigEndian) {
    auto source = make_source(bytes({0x00, 'a'}), TextEncoding::UTF16);
    EXPECT_EQ(drain(*source), U"a");
}

TEST(MakeSourceTest, ExplicitUnsupportedEncodingThrows) {
    try {
        make_source("abc", TextEncoding::SHIFT_JIS);
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_ENCODING);
    }
}
