/**
 * @file utf8.h
 * @brief UTF-8 conversion helpers shared by the reader and the writer.
 *
 * Field text crosses the public API as UTF-8 (`std::string`), while the
 * parser and the scalar encoder work one code point at a time. These
 * helpers convert between the two representations.
 */

#ifndef UNICSV_UTF8_H
#define UNICSV_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace unicsv {

/**
 * @brief Whether a value is a Unicode scalar (not a surrogate, <= U+10FFFF).
 */
inline bool is_unicode_scalar(char32_t cp) {
  return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

/**
 * @brief Decode a UTF-8 sequence starting at the given position.
 *
 * @param str The UTF-8 string
 * @param pos Starting byte position
 * @param[out] codepoint The decoded code point
 * @return The number of bytes consumed (1-4), or 0 when the sequence is
 *         truncated, overlong, a surrogate, or out of range
 */
size_t utf8_decode(std::string_view str, size_t pos, char32_t& codepoint);

/**
 * @brief Append the UTF-8 encoding of a scalar to a string.
 * @return The number of bytes appended (0 if cp is not a Unicode scalar)
 */
size_t utf8_append(std::string& out, char32_t cp);

/// UTF-8 encode a code point sequence (non-scalars are skipped)
std::string to_utf8(std::u32string_view str);

/// Decode UTF-8 text; throws CsvException(INVALID_UTF8) on malformed input
std::u32string from_utf8(std::string_view str);

/**
 * @brief Printable form of a scalar sequence for logs and CLI output.
 *
 * Control characters are rendered as escapes (\n, \r, \t, \xNN), everything
 * else is UTF-8 encoded.
 */
std::string escape_scalars(std::u32string_view str);

} // namespace unicsv

#endif // UNICSV_UTF8_H
