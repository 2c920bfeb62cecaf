#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "error.h"
#include "scalar_encoder.h"
#include "test_helpers.h"

using namespace unicsv;

// ============================================================================
// Fixed test vectors
// ============================================================================

class ScalarEncoderTest : public ::testing::Test {
protected:
    std::vector<uint8_t> encode(TextEncoding encoding, std::u32string_view text,
                                BomStrategy bom = BomStrategy::NEVER) {
        MemorySink sink;
        auto encoder = make_scalar_encoder(sink, encoding, bom);
        encoder->encode(text);
        return sink.bytes();
    }
};

TEST_F(ScalarEncoderTest, AsciiLetter) {
    EXPECT_EQ(encode(TextEncoding::ASCII, U"A"), bytes_of({0x41}));
}

TEST_F(ScalarEncoderTest, Utf8TwoByteSequence) {
    EXPECT_EQ(encode(TextEncoding::UTF8, U"é"), bytes_of({0xC3, 0xA9}));
}

TEST_F(ScalarEncoderTest, Utf16BigEndian) {
    EXPECT_EQ(encode(TextEncoding::UTF16_BE, U"A"), bytes_of({0x00, 0x41}));
}

TEST_F(ScalarEncoderTest, Utf16LittleEndian) {
    EXPECT_EQ(encode(TextEncoding::UTF16_LE, U"A"), bytes_of({0x41, 0x00}));
}

TEST_F(ScalarEncoderTest, Utf16SurrogatePairs) {
    EXPECT_EQ(encode(TextEncoding::UTF16_BE, U"\U0001F600"), bytes_of({0xD8, 0x3D, 0xDE, 0x00}));
    EXPECT_EQ(encode(TextEncoding::UTF16_LE, U"\U0001F600"), bytes_of({0x3D, 0xD8, 0x00, 0xDE}));
}

TEST_F(ScalarEncoderTest, Utf16DefaultIsBigEndianWithBom) {
    EXPECT_EQ(encode(TextEncoding::UTF16, U"A", BomStrategy::CONVENTION),
              bytes_of({0xFE, 0xFF, 0x00, 0x41}));
}

TEST_F(ScalarEncoderTest, Utf32BothByteOrders) {
    EXPECT_EQ(encode(TextEncoding::UTF32_BE, U"A"), bytes_of({0x00, 0x00, 0x00, 0x41}));
    EXPECT_EQ(encode(TextEncoding::UTF32_LE, U"\U0001F600"), bytes_of({0x00, 0xF6, 0x01, 0x00}));
}

TEST_F(ScalarEncoderTest, Utf32DefaultWritesBom) {
    EXPECT_EQ(encode(TextEncoding::UTF32, U"A", BomStrategy::CONVENTION),
              bytes_of({0x00, 0x00, 0xFE, 0xFF, 0x00, 0x00, 0x00, 0x41}));
}

TEST_F(ScalarEncoderTest, Utf8BomOnlyWhenAskedFor) {
    EXPECT_EQ(encode(TextEncoding::UTF8, U"a", BomStrategy::CONVENTION), bytes_of({0x61}));
    EXPECT_EQ(encode(TextEncoding::UTF8, U"a", BomStrategy::ALWAYS),
              bytes_of({0xEF, 0xBB, 0xBF, 0x61}));
}

TEST_F(ScalarEncoderTest, ShiftJis) {
    // "あ" is 82 A0, ASCII stays single byte
    EXPECT_EQ(encode(TextEncoding::SHIFT_JIS, U"aあ"), bytes_of({0x61, 0x82, 0xA0}));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ScalarEncoderTest, AsciiRejectsNonAsciiWithoutWriting) {
    MemorySink sink;
    auto encoder = make_scalar_encoder(sink, TextEncoding::ASCII);
    encoder->encode(U'a');
    try {
        encoder->encode(0xE9);
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_SCALAR);
        EXPECT_EQ(error_category(e.code()), ErrorCategory::ENCODING);
        ASSERT_TRUE(e.error().scalar.has_value());
        EXPECT_EQ(*e.error().scalar, 0xE9u);
        EXPECT_EQ(e.error().detail("encoding"), "ASCII");
    }
    EXPECT_EQ(sink.str(), "a") << "A failed code point writes no bytes";
    EXPECT_EQ(encoder->scalars_written(), 1u);
}

TEST_F(ScalarEncoderTest, ShiftJisRejectsUnmappedScalar) {
    MemorySink sink;
    auto encoder = make_scalar_encoder(sink, TextEncoding::SHIFT_JIS);
    EXPECT_THROW(encoder->encode(U'\U0001F600'), CsvException);
    EXPECT_TRUE(sink.bytes().empty());
}

TEST_F(ScalarEncoderTest, SurrogateIsNotEncodable) {
    MemorySink sink;
    auto encoder = make_scalar_encoder(sink, TextEncoding::UTF16_BE);
    EXPECT_THROW(encoder->encode(0xD800), CsvException);
    EXPECT_TRUE(sink.bytes().empty());
}

TEST_F(ScalarEncoderTest, UnsupportedEncodingFailsBeforeAnyByte) {
    MemorySink sink;
    try {
        make_scalar_encoder(sink, TextEncoding::LATIN1, BomStrategy::ALWAYS);
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_ENCODING);
        EXPECT_EQ(e.error().detail("encoding"), "Latin-1");
    }
    EXPECT_TRUE(sink.bytes().empty());
}

TEST_F(ScalarEncoderTest, ClosedSinkFailsFirst) {
    MemorySink sink;
    sink.close();
    try {
        make_scalar_encoder(sink, TextEncoding::LATIN1);
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::STREAM_NOT_OPEN) << "Sink state is checked first";
    }
}

TEST_F(ScalarEncoderTest, StalledSinkSurfacesStreamError) {
    StalledSink sink;
    auto encoder = make_scalar_encoder(sink, TextEncoding::UTF8);
    try {
        encoder->encode(U'x');
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::STREAM_EMPTY_WRITE);
    }
    EXPECT_EQ(sink.calls(), 2);
}

TEST_F(ScalarEncoderTest, CountsScalarsAndBytes) {
    MemorySink sink;
    auto encoder = make_scalar_encoder(sink, TextEncoding::UTF16);
    encoder->encode(U"ab");
    EXPECT_EQ(encoder->scalars_written(), 2u);
    EXPECT_EQ(encoder->bytes_written(), 6u) << "Two units plus the byte-order mark";
    EXPECT_EQ(encoder->encoding(), TextEncoding::UTF16);
}
