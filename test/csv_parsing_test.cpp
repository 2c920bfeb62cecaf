#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "csv_reader.h"
#include "test_helpers.h"

using namespace unicsv;

using Rows = std::vector<std::vector<std::string>>;

// ============================================================================
// Basic parsing
// ============================================================================

class CSVParserTest : public ::testing::Test {
protected:
    static ReaderOptions with_header() {
        ReaderOptions options;
        options.header = HeaderStrategy::FIRST_LINE;
        return options;
    }
};

TEST_F(CSVParserTest, SimpleRows) {
    EXPECT_EQ(parse_all("a,b,c\n1,2,3\n"), (Rows{{"a", "b", "c"}, {"1", "2", "3"}}));
}

TEST_F(CSVParserTest, LastRowWithoutDelimiter) {
    EXPECT_EQ(parse_all("a,b\n1,2"), (Rows{{"a", "b"}, {"1", "2"}}));
}

TEST_F(CSVParserTest, EmptyFields) {
    EXPECT_EQ(parse_all(",a,\n,,\n"), (Rows{{"", "a", ""}, {"", "", ""}}));
}

TEST_F(CSVParserTest, TrailingFieldDelimiterAtEndOfInput) {
    EXPECT_EQ(parse_all("a,"), (Rows{{"a", ""}}));
}

TEST_F(CSVParserTest, EmptyInputHasNoRows) {
    EXPECT_TRUE(parse_all("").empty());
}

TEST_F(CSVParserTest, EmptyLinesAreSkipped) {
    ReaderFixture f("a,b\n\n\n1,2\n\n");
    auto first = f.reader.read_row();
    auto second = f.reader.read_row();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->index, 0u);
    EXPECT_EQ(second->index, 1u) << "Empty lines do not advance the row index";
    EXPECT_EQ(second->fields, (std::vector<std::string>{"1", "2"}));
    EXPECT_FALSE(f.reader.read_row().has_value());
    EXPECT_TRUE(f.reader.is_at_end());
}

TEST_F(CSVParserTest, RowIndicesAreSequential) {
    ReaderFixture f("x\ny\nz\n");
    auto rows = f.reader.read_all();
    ASSERT_EQ(rows.size(), 3u);
    for (size_t i = 0; i < rows.size(); ++i) EXPECT_EQ(rows[i].index, i);
    EXPECT_EQ(f.reader.rows_read(), 3u);
}

// ============================================================================
// Quoting
// ============================================================================

TEST_F(CSVParserTest, QuotedFieldKeepsDelimiters) {
    EXPECT_EQ(parse_all("\"a,b\",\"c\nd\"\n"), (Rows{{"a,b", "c\nd"}}));
}

TEST_F(CSVParserTest, DoubledQuoteIsLiteral) {
    EXPECT_EQ(parse_all("\"say \"\"hi\"\"\",x\n"), (Rows{{"say \"hi\"", "x"}}));
}

TEST_F(CSVParserTest, EmptyQuotedField) {
    EXPECT_EQ(parse_all("\"\",a\n\"\"\n"), (Rows{{"", "a"}, {""}}));
}

TEST_F(CSVParserTest, QuoteInsideUnquotedFieldIsText) {
    EXPECT_EQ(parse_all("ab\"c,d\n"), (Rows{{"ab\"c", "d"}}));
}

TEST_F(CSVParserTest, QuotedFieldAtEndOfInput) {
    EXPECT_EQ(parse_all("a,\"b\""), (Rows{{"a", "b"}}));
}

// ============================================================================
// Delimiters
// ============================================================================

TEST_F(CSVParserTest, MultiScalarDelimiters) {
    ReaderOptions options;
    options.field_delimiter = U"::";
    options.row_delimiter = U"\r\n";
    EXPECT_EQ(parse_all("a::b:c\r\n1::2\r\n", options), (Rows{{"a", "b:c"}, {"1", "2"}}));
}

TEST_F(CSVParserTest, PartialRowDelimiterIsText) {
    ReaderOptions options;
    options.row_delimiter = U"\r\n";
    EXPECT_EQ(parse_all("a\rb,c\r\n", options), (Rows{{"a\rb", "c"}}));
}

TEST_F(CSVParserTest, DelimiterPrefixAtEndOfInput) {
    ReaderOptions options;
    options.field_delimiter = U"||";
    EXPECT_EQ(parse_all("a||b|", options), (Rows{{"a", "b|"}}));
}

TEST_F(CSVParserTest, NonAsciiDelimiter) {
    ReaderOptions options;
    options.field_delimiter = U"→";
    EXPECT_EQ(parse_all("a→é\nb→c\n", options), (Rows{{"a", "é"}, {"b", "c"}}));
}

// ============================================================================
// Trimming
// ============================================================================

TEST_F(CSVParserTest, TrimsUnquotedFields) {
    ReaderOptions options;
    options.trim = TrimStrategy::WHITESPACES;
    EXPECT_EQ(parse_all("  a ,\tb\t\n", options), (Rows{{"a", "b"}}));
}

TEST_F(CSVParserTest, QuotedFieldsAreNotTrimmed) {
    ReaderOptions options;
    options.trim = TrimStrategy::WHITESPACES;
    EXPECT_EQ(parse_all(" \" a \" , b\n", options), (Rows{{" a ", "b"}}));
}

TEST_F(CSVParserTest, CustomTrimSet) {
    ReaderOptions options;
    options.trim = TrimStrategy::SET;
    options.trim_set = U"*";
    EXPECT_EQ(parse_all("**a*,b**\n", options), (Rows{{"a", "b"}}));
}

TEST_F(CSVParserTest, InteriorTrimScalarsStay) {
    ReaderOptions options;
    options.trim = TrimStrategy::WHITESPACES;
    EXPECT_EQ(parse_all(" a b ,c\n", options), (Rows{{"a b", "c"}}));
}

// ============================================================================
// Header and inference
// ============================================================================

TEST_F(CSVParserTest, HeaderIsConsumed) {
    ReaderFixture f("name,qty\nfoo,2\n", with_header());
    EXPECT_EQ(f.reader.headers(), (std::vector<std::string>{"name", "qty"}));
    EXPECT_EQ(f.reader.header_index("qty"), 1u);
    EXPECT_FALSE(f.reader.header_index("price").has_value());
    auto row = f.reader.read_row();
    ASSERT_TRUE(row);
    EXPECT_EQ(row->index, 0u);
    EXPECT_EQ(row->fields, (std::vector<std::string>{"foo", "2"}));
}

TEST_F(CSVParserTest, HeaderOnEmptyInput) {
    ReaderFixture f("", with_header());
    EXPECT_TRUE(f.reader.headers().empty());
    EXPECT_FALSE(f.reader.read_row().has_value());
}

TEST_F(CSVParserTest, InferredConfigurationParsesWholeInput) {
    ReaderFixture f("a,b,c\n1,2,3\n4,5,6\n", ReaderOptions::inferred());
    EXPECT_TRUE(f.reader.config().has_header);
    EXPECT_EQ(f.reader.headers(), (std::vector<std::string>{"a", "b", "c"}));
    auto rows = f.reader.read_all();
    ASSERT_EQ(rows.size(), 2u) << "Inference must not swallow any row";
    EXPECT_EQ(rows[0].fields, (std::vector<std::string>{"1", "2", "3"}));
    EXPECT_EQ(rows[1].fields, (std::vector<std::string>{"4", "5", "6"}));
}

TEST_F(CSVParserTest, InferredSemicolonWithCrlf) {
    ReaderFixture f("x;y\r\n\"1;0\";2\r\n3;4\r\n", ReaderOptions::inferred());
    EXPECT_EQ(f.reader.config().delimiters, (Delimiters{U";", U"\r\n"}));
    auto rows = f.reader.read_all();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].fields, (std::vector<std::string>{"1;0", "2"}));
}

TEST_F(CSVParserTest, Utf16Input) {
    std::string bytes = {'\xFF', '\xFE', 'a', 0, ',', 0, 'b', 0, '\n', 0};
    auto source = make_source(bytes);
    CsvReader reader(*source);
    auto row = reader.read_row();
    ASSERT_TRUE(row);
    EXPECT_EQ(row->fields, (std::vector<std::string>{"a", "b"}));
}
