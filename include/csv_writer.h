/**
 * @file csv_writer.h
 * @brief Row/field assembly on top of the scalar encoder.
 */

#ifndef UNICSV_CSV_WRITER_H
#define UNICSV_CSV_WRITER_H

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "dialect.h"
#include "encoding.h"
#include "scalar_encoder.h"
#include "stream_writer.h"

namespace unicsv {

struct WriterOptions {
    Delimiters delimiters;
    TextEncoding encoding = TextEncoding::UTF8;
    BomStrategy bom = BomStrategy::CONVENTION;
    std::vector<std::string> headers;  ///< Written first when non-empty
};

/**
 * @brief Writes rows of UTF-8 field text as CSV in the configured encoding.
 *
 * A field is quoted when it holds the quote character, CR, LF or any scalar
 * of either delimiter, or when it is the only field of its row and empty.
 * Quotes inside a quoted field are doubled.
 */
class CsvWriter {
public:
    /// @throws CsvException for bad delimiters or any ScalarEncoder failure
    CsvWriter(OutputSink& sink, const WriterOptions& options = WriterOptions());

    CsvWriter(const CsvWriter&) = delete;
    CsvWriter& operator=(const CsvWriter&) = delete;

    void write_field(std::string_view field);
    void end_row();
    void write_row(const std::vector<std::string>& fields);

    /// Rows completed, header included
    size_t rows_written() const { return rows_written_; }

    const ScalarEncoder& encoder() const { return *encoder_; }

    /// Whether `field` must be quoted under `delimiters`
    static bool needs_quoting(std::u32string_view field, const Delimiters& delimiters);

private:
    WriterOptions options_;
    std::unique_ptr<ScalarEncoder> encoder_;
    size_t fields_in_row_ = 0;
    size_t rows_written_ = 0;
    bool lone_empty_pending_ = false;

    void write_scalars(std::u32string_view field);
};

}  // namespace unicsv

#endif  // UNICSV_CSV_WRITER_H
