/**
 * @file decoding_buffer.h
 * @brief Row cache serving out-of-order row and field requests.
 */

#ifndef UNICSV_DECODING_BUFFER_H
#define UNICSV_DECODING_BUFFER_H

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include "csv_reader.h"
#include "dialect.h"
#include "scalar_source.h"

namespace unicsv {

/// How many parsed rows stay reachable
enum class BufferingPolicy {
    KEEP_ALL,    ///< Every row produced so far
    SEQUENTIAL   ///< Only the row being decoded; moving forward discards earlier rows
};

const char* buffering_policy_to_string(BufferingPolicy policy);

/**
 * @brief Sits between the sequential parser and a structured decoder.
 *
 * Rows are parsed on demand. Under KEEP_ALL any row up to the highest one
 * produced can be requested again. Under SEQUENTIAL a request for row N
 * drops every row before N for good; asking for one of them afterwards is a
 * BUFFER_FAILURE. Fields of a retained row can be read in any order under
 * both policies.
 *
 * Returned references stay valid until the row is discarded.
 */
class DecodingBuffer {
public:
    DecodingBuffer(CsvReader& reader, BufferingPolicy policy);

    BufferingPolicy policy() const { return policy_; }

    /// Row `index`, parsing forward as needed
    const Row& row(size_t index);

    /// Field `column` of row `index`
    const std::string& field(size_t index, size_t column);

    /// Field of row `index` under header name `key`
    const std::string& field(size_t index, std::string_view key);

    /// Whether row `index` exists; parses forward, so it may discard rows
    bool contains(size_t index);

    /// Lowest row index still retained (rows_produced() when none is)
    size_t first_available() const { return first_index_; }

    /// Rows produced by the parser so far
    size_t rows_produced() const { return first_index_ + rows_.size(); }

    /// Rows currently held
    size_t retained() const { return rows_.size(); }

private:
    CsvReader& reader_;
    BufferingPolicy policy_;
    std::deque<Row> rows_;
    size_t first_index_ = 0;

    bool fill_to(size_t index);
    void discard_before(size_t index);
};

/**
 * @brief Settings of one decoding session.
 *
 * The reader and detection settings are held as named members rather than
 * flattened into this struct.
 */
struct DecoderConfig {
    ReaderOptions reader;
    DetectionOptions detection;
    BufferingPolicy buffering = BufferingPolicy::KEEP_ALL;
};

/**
 * @brief A decoding session: owns the reader and its row buffer.
 */
class RowDecoder {
public:
    RowDecoder(ScalarSource& source, const DecoderConfig& config = DecoderConfig());

    RowDecoder(const RowDecoder&) = delete;
    RowDecoder& operator=(const RowDecoder&) = delete;

    const DecoderConfig& config() const { return config_; }
    CsvReader& reader() { return *reader_; }
    DecodingBuffer& buffer() { return *buffer_; }

    const std::vector<std::string>& headers() const { return reader_->headers(); }

    const Row& row(size_t index) { return buffer_->row(index); }
    const std::string& field(size_t index, size_t column) { return buffer_->field(index, column); }
    const std::string& field(size_t index, std::string_view key) {
        return buffer_->field(index, key);
    }
    bool contains(size_t index) { return buffer_->contains(index); }

private:
    DecoderConfig config_;
    std::unique_ptr<CsvReader> reader_;
    std::unique_ptr<DecodingBuffer> buffer_;
};

}  // namespace unicsv

#endif  // UNICSV_DECODING_BUFFER_H
