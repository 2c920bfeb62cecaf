#include "scalar_source.h"

#include "debug.h"
#include "error.h"
#include "simd_highway.h"
#include "utf8.h"

#include <algorithm>
#include <initializer_list>
#include <string_view>

namespace unicsv {

// ============================================================================
// Utf8Source
// ============================================================================

Utf8Source::Utf8Source(std::string bytes) : bytes_(std::move(bytes)) {
    if (bytes_.size() >= 3 && static_cast<uint8_t>(bytes_[0]) == 0xEF &&
        static_cast<uint8_t>(bytes_[1]) == 0xBB && static_cast<uint8_t>(bytes_[2]) == 0xBF) {
        pos_ = 3;
    }
    ascii_end_ = pos_;
}

std::optional<char32_t> Utf8Source::next() {
    if (likely(pos_ < ascii_end_)) {
        return static_cast<char32_t>(static_cast<uint8_t>(bytes_[pos_++]));
    }
    if (pos_ >= bytes_.size()) {
        return std::nullopt;
    }

    // Look for the next ASCII run before falling back to the decoder
    const size_t window = std::min(bytes_.size() - pos_, size_t(UNICSV_ASCII_RUN));
    const size_t run = ascii_run_length(
        reinterpret_cast<const uint8_t*>(bytes_.data()) + pos_, window);
    if (run > 0) {
        ascii_end_ = pos_ + run;
        return static_cast<char32_t>(static_cast<uint8_t>(bytes_[pos_++]));
    }

    char32_t cp = 0;
    size_t len = utf8_decode(bytes_, pos_, cp);
    if (len == 0) {
        throw CsvException(CsvError(ErrorCode::INVALID_UTF8,
                                    "Invalid UTF-8 sequence in the input",
                                    "Make sure the input is UTF-8 or select the right encoding.")
                               .with_offset(pos_));
    }
    pos_ += len;
    ascii_end_ = pos_;
    return cp;
}

// ============================================================================
// Utf16Source
// ============================================================================

Utf16Source::Utf16Source(std::string bytes, bool big_endian, size_t start)
    : bytes_(std::move(bytes)), big_endian_(big_endian), pos_(start) {}

uint16_t Utf16Source::read_unit(size_t at) const {
    const uint8_t b0 = static_cast<uint8_t>(bytes_[at]);
    const uint8_t b1 = static_cast<uint8_t>(bytes_[at + 1]);
    if (big_endian_) {
        return static_cast<uint16_t>((b0 << 8) | b1);
    }
    return static_cast<uint16_t>(b0 | (b1 << 8));
}

static CsvError invalid_utf16(size_t offset) {
    return CsvError(ErrorCode::INVALID_UTF16, "Invalid UTF-16 sequence in the input",
                    "Check the byte order of the input or select a different encoding.")
        .with_offset(offset);
}

std::optional<char32_t> Utf16Source::next() {
    if (pos_ >= bytes_.size()) {
        return std::nullopt;
    }
    if (pos_ + 2 > bytes_.size()) {
        throw CsvException(invalid_utf16(pos_));
    }

    const uint16_t cu = read_unit(pos_);
    if (cu < 0xD800 || cu > 0xDFFF) {
        pos_ += 2;
        return static_cast<char32_t>(cu);
    }

    // High surrogate must be followed by a low surrogate
    if (cu > 0xDBFF || pos_ + 4 > bytes_.size()) {
        throw CsvException(invalid_utf16(pos_));
    }
    const uint16_t cu2 = read_unit(pos_ + 2);
    if (cu2 < 0xDC00 || cu2 > 0xDFFF) {
        throw CsvException(invalid_utf16(pos_));
    }
    pos_ += 4;
    return 0x10000 + ((static_cast<char32_t>(cu - 0xD800) << 10) | (cu2 - 0xDC00));
}

// ============================================================================
// Utf32Source
// ============================================================================

Utf32Source::Utf32Source(std::string bytes, bool big_endian, size_t start)
    : bytes_(std::move(bytes)), big_endian_(big_endian), pos_(start) {}

std::optional<char32_t> Utf32Source::next() {
    if (pos_ >= bytes_.size()) {
        return std::nullopt;
    }
    if (pos_ + 4 > bytes_.size()) {
        throw CsvException(CsvError(ErrorCode::INVALID_UTF32, "Truncated UTF-32 unit at end of input")
                               .with_offset(pos_));
    }

    const auto* p = reinterpret_cast<const uint8_t*>(bytes_.data()) + pos_;
    char32_t cp;
    if (big_endian_) {
        cp = (static_cast<char32_t>(p[0]) << 24) | (static_cast<char32_t>(p[1]) << 16) |
             (static_cast<char32_t>(p[2]) << 8) | p[3];
    } else {
        cp = p[0] | (static_cast<char32_t>(p[1]) << 8) | (static_cast<char32_t>(p[2]) << 16) |
             (static_cast<char32_t>(p[3]) << 24);
    }
    if (!is_unicode_scalar(cp)) {
        throw CsvException(CsvError(ErrorCode::INVALID_UTF32,
                                    "UTF-32 unit is not a Unicode scalar",
                                    "Check the byte order of the input or select a different encoding.")
                               .with_offset(pos_)
                               .with_scalar(cp));
    }
    pos_ += 4;
    return cp;
}

// ============================================================================
// Factories
// ============================================================================

std::unique_ptr<ScalarSource> make_source(std::string bytes) {
    auto detected = detect_encoding(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
    auto& trace = debug::global_trace();
    trace.log("Input encoding: %s (BOM %zu bytes, confidence %.2f)",
              encoding_to_string(detected.encoding), detected.bom_length, detected.confidence);

    switch (detected.encoding) {
    case TextEncoding::UTF16_BE:
        return std::make_unique<Utf16Source>(std::move(bytes), true, detected.bom_length);
    case TextEncoding::UTF16_LE:
        return std::make_unique<Utf16Source>(std::move(bytes), false, detected.bom_length);
    case TextEncoding::UTF32_BE:
        return std::make_unique<Utf32Source>(std::move(bytes), true, detected.bom_length);
    case TextEncoding::UTF32_LE:
        return std::make_unique<Utf32Source>(std::move(bytes), false, detected.bom_length);
    default:
        return std::make_unique<Utf8Source>(std::move(bytes));
    }
}

std::unique_ptr<ScalarSource> make_source(std::string bytes, TextEncoding encoding) {
    auto skip = [&bytes](std::initializer_list<uint8_t> bom) -> size_t {
        if (bytes.size() < bom.size()) return 0;
        size_t i = 0;
        for (uint8_t b : bom) {
            if (static_cast<uint8_t>(bytes[i++]) != b) return 0;
        }
        return bom.size();
    };

    switch (encoding) {
    case TextEncoding::ASCII:
    case TextEncoding::UTF8:
        return std::make_unique<Utf8Source>(std::move(bytes));
    case TextEncoding::UTF16:
    case TextEncoding::UTF16_BE: {
        size_t start = skip({0xFE, 0xFF});
        if (encoding == TextEncoding::UTF16 && start == 0 && skip({0xFF, 0xFE}) == 2) {
            return std::make_unique<Utf16Source>(std::move(bytes), false, 2);
        }
        return std::make_unique<Utf16Source>(std::move(bytes), true, start);
    }
    case TextEncoding::UTF16_LE: {
        size_t start = skip({0xFF, 0xFE});
        return std::make_unique<Utf16Source>(std::move(bytes), false, start);
    }
    case TextEncoding::UTF32:
    case TextEncoding::UTF32_BE: {
        size_t start = skip({0x00, 0x00, 0xFE, 0xFF});
        if (encoding == TextEncoding::UTF32 && start == 0 && skip({0xFF, 0xFE, 0x00, 0x00}) == 4) {
            return std::make_unique<Utf32Source>(std::move(bytes), false, 4);
        }
        return std::make_unique<Utf32Source>(std::move(bytes), true, start);
    }
    case TextEncoding::UTF32_LE: {
        size_t start = skip({0xFF, 0xFE, 0x00, 0x00});
        return std::make_unique<Utf32Source>(std::move(bytes), false, start);
    }
    default:
        throw CsvException(CsvError(ErrorCode::UNSUPPORTED_ENCODING,
                                    "The given encoding cannot be read",
                                    "Convert the input to a Unicode encoding first.")
                               .with_detail("encoding", encoding_to_string(encoding)));
    }
}

// ============================================================================
// Lookahead
// ============================================================================

std::optional<char32_t> Lookahead::next() {
    if (auto scalar = buffer_.next()) {
        from_buffer_.push_back(*scalar);
        return scalar;
    }
    auto scalar = source_.next();
    if (scalar) {
        from_source_.push_back(*scalar);
    }
    return scalar;
}

std::pair<std::u32string, bool> Lookahead::read_sample(size_t max_scalars) {
    std::u32string sample;
    while (sample.size() < max_scalars) {
        auto scalar = next();
        if (!scalar) {
            return {std::move(sample), true};
        }
        sample.push_back(*scalar);
    }
    // One scalar past the limit tells a truncated sample from a complete one;
    // it stays recorded and is restored with the rest.
    return {std::move(sample), !next().has_value()};
}

void Lookahead::restore() {
    // Source scalars were only pulled once the buffer ran dry, so they belong
    // behind whatever is still queued; buffer scalars go back in front.
    if (!from_source_.empty()) {
        buffer_.append(from_source_);
        from_source_.clear();
    }
    if (!from_buffer_.empty()) {
        buffer_.prepend(from_buffer_);
        from_buffer_.clear();
    }
}

}  // namespace unicsv
