/**
 * @file encoding.h
 * @brief Text encoding catalogue, byte-order marks and input detection.
 *
 * The reader side uses detect_encoding() to pick a code-point source for raw
 * input bytes; the writer side uses bom_for() to choose the preamble written
 * ahead of the first encoded scalar.
 */

#ifndef UNICSV_ENCODING_H
#define UNICSV_ENCODING_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace unicsv {

/**
 * @brief Text encodings known to unicsv.
 *
 * UTF16 and UTF32 leave the byte order implicit: written with a byte-order
 * mark and big-endian units. LATIN1, WINDOWS_1252 and ISO_2022_JP are
 * recognised names that the scalar encoder rejects as unsupported.
 */
enum class TextEncoding {
    ASCII,
    UTF8,
    UTF16,
    UTF16_BE,
    UTF16_LE,
    UTF32,
    UTF32_BE,
    UTF32_LE,
    SHIFT_JIS,
    LATIN1,
    WINDOWS_1252,
    ISO_2022_JP,
    UNKNOWN
};

const char* encoding_to_string(TextEncoding enc);

/**
 * @brief Parse an encoding name ("utf-8", "UTF16LE", "shift_jis", ...).
 *
 * Matching ignores case, '-' and '_'.
 * @return The encoding, or std::nullopt for unrecognised names
 */
std::optional<TextEncoding> parse_encoding(std::string_view name);

/// Whether the scalar encoder can produce this encoding
bool is_supported_output(TextEncoding enc);

/**
 * @brief When a byte-order mark is written ahead of the encoded text.
 */
enum class BomStrategy {
    CONVENTION,  ///< Only for UTF16 and UTF32 with implicit byte order
    ALWAYS,      ///< For every Unicode encoding
    NEVER        ///< Never
};

/**
 * @brief Preamble bytes for an encoding under a BOM strategy.
 * @return The byte-order mark, or an empty vector
 */
std::vector<uint8_t> bom_for(TextEncoding enc, BomStrategy strategy);

/**
 * @brief Result of input encoding detection.
 */
struct EncodingResult {
    TextEncoding encoding = TextEncoding::UTF8;
    size_t bom_length = 0;      ///< Bytes of byte-order mark to skip
    double confidence = 0.0;    ///< 1.0 when a BOM decided it
};

/**
 * @brief Detect the encoding of raw input.
 *
 * A byte-order mark is definitive. Without one, the distribution of null
 * bytes distinguishes UTF-16/UTF-32 from UTF-8.
 */
EncodingResult detect_encoding(const uint8_t* buf, size_t len);

}  // namespace unicsv

#endif  // UNICSV_ENCODING_H
