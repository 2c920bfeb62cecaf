/**
 * @file scalar_encoder.h
 * @brief Code point to byte encoding for one output sink.
 */

#ifndef UNICSV_SCALAR_ENCODER_H
#define UNICSV_SCALAR_ENCODER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "encoding.h"
#include "stream_writer.h"

namespace unicsv {

/**
 * @brief Encodes code points in one text encoding and writes them to a sink.
 *
 * Construction checks that the sink is open and the encoding supported, in
 * that order, before any byte is written, then writes the preamble. Each
 * encode() call writes all bytes of one code point or throws without
 * writing any of them.
 *
 * The encoder borrows the sink; the sink must outlive it.
 *
 * @example
 * @code
 * unicsv::MemorySink sink;
 * auto encoder = unicsv::make_scalar_encoder(sink, unicsv::TextEncoding::UTF16_LE);
 * encoder->encode(U'A');  // sink holds 41 00
 * @endcode
 */
class ScalarEncoder {
public:
    /**
     * @param sink Open output sink
     * @param encoding Target encoding
     * @param preamble Bytes written once up front (e.g. a byte-order mark)
     * @throws CsvException STREAM_NOT_OPEN, UNSUPPORTED_ENCODING
     */
    ScalarEncoder(OutputSink& sink, TextEncoding encoding,
                  const std::vector<uint8_t>& preamble = {});
    ~ScalarEncoder();

    ScalarEncoder(const ScalarEncoder&) = delete;
    ScalarEncoder& operator=(const ScalarEncoder&) = delete;

    /// @throws CsvException INVALID_SCALAR or any stream_write() failure
    void encode(char32_t scalar);

    /// Encode every code point of `text`
    void encode(std::u32string_view text);

    TextEncoding encoding() const { return encoding_; }

    /// Code points written so far
    size_t scalars_written() const { return scalars_written_; }

    /// Bytes written so far, preamble included
    size_t bytes_written() const { return bytes_written_; }

private:
    OutputSink& sink_;
    TextEncoding encoding_;
    size_t scalars_written_ = 0;
    size_t bytes_written_ = 0;

    /// iconv descriptor for table-driven encodings
    class Converter;
    std::unique_ptr<Converter> converter_;

    /// Encode into `out`; false when the code point has no representation
    bool to_bytes(char32_t scalar, uint8_t* out, size_t& len);

    void write(const uint8_t* data, size_t len);
};

/**
 * @brief Build an encoder for `encoding`, writing the preamble `bom` asks for.
 */
std::unique_ptr<ScalarEncoder> make_scalar_encoder(OutputSink& sink, TextEncoding encoding,
                                                   BomStrategy bom = BomStrategy::CONVENTION);

}  // namespace unicsv

#endif  // UNICSV_SCALAR_ENCODER_H
