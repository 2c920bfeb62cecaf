/**
 * @file csv_reader.h
 * @brief Row/field parser over a stream of code points.
 */

#ifndef UNICSV_CSV_READER_H
#define UNICSV_CSV_READER_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dialect.h"
#include "scalar_buffer.h"
#include "scalar_source.h"

namespace unicsv {

/// One parsed row: UTF-8 fields in column order plus its 0-based position
struct Row {
    size_t index = 0;
    std::vector<std::string> fields;

    size_t size() const { return fields.size(); }
    const std::string& operator[](size_t column) const { return fields[column]; }
};

/**
 * @brief Pull parser turning code points into rows.
 *
 * The configuration is resolved once in the constructor (inferring whatever
 * the options leave open) and the header row, if any, is consumed right away.
 * Every call to read_row() then yields the next data row.
 *
 * Quoted fields may hold delimiters, row delimiters and doubled quotes.
 * Malformed quoting is fatal: read_row() throws CsvException and the reader
 * must not be used afterwards.
 *
 * The source must outlive the reader.
 *
 * @example
 * @code
 * unicsv::Utf8Source source("name,qty\n\"a, b\",2\n");
 * unicsv::ReaderOptions options;
 * options.header = unicsv::HeaderStrategy::FIRST_LINE;
 * unicsv::CsvReader reader(source, options);
 * while (auto row = reader.read_row()) {
 *     // row->fields == {"a, b", "2"}
 * }
 * @endcode
 */
class CsvReader {
public:
    explicit CsvReader(ScalarSource& source, const ReaderOptions& options = ReaderOptions(),
                       const DetectionOptions& detection = DetectionOptions());

    /// Use an already resolved configuration; nothing is inferred
    CsvReader(ScalarSource& source, const ReaderConfig& config);

    CsvReader(const CsvReader&) = delete;
    CsvReader& operator=(const CsvReader&) = delete;

    const ReaderConfig& config() const { return config_; }

    /// Header fields; empty when the configuration has no header
    const std::vector<std::string>& headers() const { return headers_; }

    /// Column of a header name, if present
    std::optional<size_t> header_index(std::string_view name) const;

    /// Next data row, or std::nullopt at end of input
    std::optional<Row> read_row();

    /// Every remaining row
    std::vector<Row> read_all();

    /// Data rows produced so far
    size_t rows_read() const { return rows_read_; }

    bool is_at_end() const { return at_end_; }

    /// Code points consumed by the parser so far
    size_t offset() const { return offset_; }

private:
    enum class State {
        BETWEEN_ROWS,
        IN_UNQUOTED_FIELD,
        IN_QUOTED_FIELD,
        AFTER_CLOSING_QUOTE,
        ROW_COMPLETE,
        END_OF_INPUT
    };

    enum class Match { NONE, FIELD, ROW };

    ScalarSource& source_;
    ScalarBuffer buffer_;
    ReaderConfig config_;
    std::vector<std::string> headers_;
    size_t rows_read_ = 0;
    size_t offset_ = 0;
    bool at_end_ = false;

    std::optional<char32_t> next();

    /// Whether `first` starts a delimiter; the rest of it is consumed on a match
    Match match_delimiter(char32_t first);
    bool match_rest(const std::u32string& delimiter);

    /// Parse one row; std::nullopt when the input ends before a row starts
    std::optional<std::vector<std::string>> parse_row();

    void finish_field(std::vector<std::string>& fields, std::u32string& field, bool quoted) const;

    void read_header();

    static const char* state_name(State state);
};

}  // namespace unicsv

#endif  // UNICSV_CSV_READER_H
