/**
 * @file scalar_source.h
 * @brief Code-point sources feeding the CSV parser and the inference scanners.
 *
 * A ScalarSource yields Unicode scalars one at a time and can be iterated only
 * once. The parser always reads through a ScalarBuffer first, so anything a
 * scanner looked ahead at (and restored) is seen again in the original order.
 */

#ifndef UNICSV_SCALAR_SOURCE_H
#define UNICSV_SCALAR_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "encoding.h"
#include "scalar_buffer.h"

namespace unicsv {

/**
 * @brief Single-pass producer of Unicode scalars.
 */
class ScalarSource {
public:
    virtual ~ScalarSource() = default;

    /// Next scalar, or std::nullopt at end of input. Malformed input throws.
    virtual std::optional<char32_t> next() = 0;

    /// Units (bytes or scalars) consumed so far, for error positions
    virtual size_t offset() const = 0;
};

/**
 * @brief Decodes UTF-8 bytes. A leading UTF-8 BOM is skipped.
 *
 * ASCII runs are located with a Highway scan and handed out without going
 * through the multi-byte decoder. Invalid sequences throw
 * CsvException(INVALID_UTF8) carrying the byte offset.
 */
class Utf8Source : public ScalarSource {
public:
    explicit Utf8Source(std::string bytes);

    std::optional<char32_t> next() override;
    size_t offset() const override { return pos_; }

private:
    std::string bytes_;
    size_t pos_ = 0;
    size_t ascii_end_ = 0;  // bytes_[pos_, ascii_end_) known to be ASCII
};

/**
 * @brief Decodes UTF-16 code units in a fixed byte order.
 *
 * Surrogate pairs are combined; an unpaired surrogate or a trailing odd byte
 * throws CsvException(INVALID_UTF16).
 */
class Utf16Source : public ScalarSource {
public:
    Utf16Source(std::string bytes, bool big_endian, size_t start = 0);

    std::optional<char32_t> next() override;
    size_t offset() const override { return pos_; }

private:
    std::string bytes_;
    bool big_endian_;
    size_t pos_;

    uint16_t read_unit(size_t at) const;
};

/**
 * @brief Decodes UTF-32 code units in a fixed byte order.
 *
 * Units that are not Unicode scalars, and truncated units, throw
 * CsvException(INVALID_UTF32).
 */
class Utf32Source : public ScalarSource {
public:
    Utf32Source(std::string bytes, bool big_endian, size_t start = 0);

    std::optional<char32_t> next() override;
    size_t offset() const override { return pos_; }

private:
    std::string bytes_;
    bool big_endian_;
    size_t pos_;
};

/**
 * @brief Serves code points that are already decoded.
 */
class U32StringSource : public ScalarSource {
public:
    explicit U32StringSource(std::u32string scalars) : scalars_(std::move(scalars)) {}

    std::optional<char32_t> next() override {
        if (pos_ >= scalars_.size()) return std::nullopt;
        return scalars_[pos_++];
    }
    size_t offset() const override { return pos_; }

private:
    std::u32string scalars_;
    size_t pos_ = 0;
};

/**
 * @brief Picks a source for raw bytes from their detected encoding.
 *
 * The byte-order mark (if any) is skipped. Input whose encoding cannot be
 * read (e.g. Shift-JIS without a BOM is indistinguishable from bad UTF-8)
 * is treated as UTF-8 and rejected while reading.
 */
std::unique_ptr<ScalarSource> make_source(std::string bytes);

/// Source for an explicit encoding; throws UNSUPPORTED_ENCODING otherwise
std::unique_ptr<ScalarSource> make_source(std::string bytes, TextEncoding encoding);

/// Next scalar of a parsing session: pushed-back scalars first, then the source
inline std::optional<char32_t> next_scalar(ScalarSource& source, ScalarBuffer& buffer) {
    if (auto scalar = buffer.next()) return scalar;
    return source.next();
}

/**
 * @brief Scope guard that reads ahead and restores everything it read.
 *
 * Scalars taken from the buffer are prepended back and scalars pulled from
 * the source are appended, so after restore() (or destruction, including
 * during stack unwinding) the session sees the untouched stream.
 */
class Lookahead {
public:
    Lookahead(ScalarSource& source, ScalarBuffer& buffer)
        : source_(source), buffer_(buffer) {}
    ~Lookahead() { restore(); }

    Lookahead(const Lookahead&) = delete;
    Lookahead& operator=(const Lookahead&) = delete;

    std::optional<char32_t> next();

    /// Read up to max_scalars scalars into a string; the bool is true if input ended
    std::pair<std::u32string, bool> read_sample(size_t max_scalars);

    size_t consumed() const { return from_buffer_.size() + from_source_.size(); }

    void restore();

private:
    ScalarSource& source_;
    ScalarBuffer& buffer_;
    std::u32string from_buffer_;
    std::u32string from_source_;
};

}  // namespace unicsv

#endif  // UNICSV_SCALAR_SOURCE_H
