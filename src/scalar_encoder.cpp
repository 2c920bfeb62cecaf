#include "scalar_encoder.h"

#include <cerrno>
#include <cstring>
#include <iconv.h>

#include "debug.h"
#include "error.h"
#include "utf8.h"

namespace unicsv {

namespace {

// Longest encoding of one code point across the supported encodings
constexpr size_t MAX_SCALAR_BYTES = 8;

void put16(uint8_t* out, uint16_t unit, bool big_endian) {
    out[big_endian ? 0 : 1] = static_cast<uint8_t>(unit >> 8);
    out[big_endian ? 1 : 0] = static_cast<uint8_t>(unit & 0xFF);
}

void put32(uint8_t* out, uint32_t unit, bool big_endian) {
    for (int i = 0; i < 4; ++i) {
        uint8_t byte = static_cast<uint8_t>(unit >> (8 * (3 - i)));
        out[big_endian ? i : 3 - i] = byte;
    }
}

size_t utf16_units(char32_t scalar, uint8_t* out, bool big_endian) {
    if (scalar < 0x10000) {
        put16(out, static_cast<uint16_t>(scalar), big_endian);
        return 2;
    }
    uint32_t v = scalar - 0x10000;
    put16(out, static_cast<uint16_t>(0xD800 + (v >> 10)), big_endian);
    put16(out + 2, static_cast<uint16_t>(0xDC00 + (v & 0x3FF)), big_endian);
    return 4;
}

}  // namespace

// ============================================================================
// Converter (iconv)
// ============================================================================

class ScalarEncoder::Converter {
public:
    explicit Converter(const char* to) {
        cd_ = iconv_open(to, "UTF-32BE");
        if (cd_ == reinterpret_cast<iconv_t>(-1)) {
            int err = errno;
            throw CsvException(
                CsvError(ErrorCode::UNSUPPORTED_ENCODING,
                         std::string("iconv cannot convert to ") + to,
                         "The system iconv lacks this encoding")
                    .with_detail("encoding", to)
                    .with_detail("errno", std::strerror(err)));
        }
    }

    ~Converter() { iconv_close(cd_); }

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    bool convert(char32_t scalar, uint8_t* out, size_t& len) {
        uint8_t in[4];
        put32(in, scalar, true);
        char* inptr = reinterpret_cast<char*>(in);
        size_t inleft = sizeof(in);
        char* outptr = reinterpret_cast<char*>(out);
        size_t outleft = MAX_SCALAR_BYTES;

        // Back to the initial shift state for every code point
        iconv(cd_, nullptr, nullptr, nullptr, nullptr);
        size_t rc = iconv(cd_, &inptr, &inleft, &outptr, &outleft);
        if (rc == static_cast<size_t>(-1) || inleft != 0) return false;
        iconv(cd_, nullptr, nullptr, &outptr, &outleft);
        len = MAX_SCALAR_BYTES - outleft;
        return len > 0;
    }

private:
    iconv_t cd_;
};

// ============================================================================
// ScalarEncoder
// ============================================================================

ScalarEncoder::ScalarEncoder(OutputSink& sink, TextEncoding encoding,
                             const std::vector<uint8_t>& preamble)
    : sink_(sink), encoding_(encoding) {
    if (!sink_.is_open()) {
        throw CsvException(CsvError(ErrorCode::STREAM_NOT_OPEN, "Output stream is not open",
                                    "Open the sink before creating the writer")
                               .with_detail("status", stream_status_to_string(sink_.status()))
                               .with_detail("encoding", encoding_to_string(encoding_)));
    }
    if (!is_supported_output(encoding_)) {
        throw CsvException(CsvError(ErrorCode::UNSUPPORTED_ENCODING,
                                    std::string("Cannot write ") + encoding_to_string(encoding_),
                                    "Supported: ASCII, UTF-8, UTF-16, UTF-32 and Shift-JIS")
                               .with_detail("encoding", encoding_to_string(encoding_)));
    }
    if (encoding_ == TextEncoding::SHIFT_JIS) {
        converter_ = std::make_unique<Converter>("SHIFT_JIS");
    }

    auto& trace = debug::global_trace();
    if (trace.verbose()) {
        trace.log("encoder: %s, %zu preamble byte(s)", encoding_to_string(encoding_),
                  preamble.size());
    }
    if (!preamble.empty()) write(preamble.data(), preamble.size());
}

ScalarEncoder::~ScalarEncoder() = default;

bool ScalarEncoder::to_bytes(char32_t scalar, uint8_t* out, size_t& len) {
    switch (encoding_) {
        case TextEncoding::ASCII:
            if (scalar > 0x7F) return false;
            out[0] = static_cast<uint8_t>(scalar);
            len = 1;
            return true;
        case TextEncoding::UTF8: {
            std::string bytes;
            len = utf8_append(bytes, scalar);
            std::memcpy(out, bytes.data(), len);
            return len > 0;
        }
        case TextEncoding::UTF16:
        case TextEncoding::UTF16_BE:
            len = utf16_units(scalar, out, true);
            return true;
        case TextEncoding::UTF16_LE:
            len = utf16_units(scalar, out, false);
            return true;
        case TextEncoding::UTF32:
        case TextEncoding::UTF32_BE:
            put32(out, scalar, true);
            len = 4;
            return true;
        case TextEncoding::UTF32_LE:
            put32(out, scalar, false);
            len = 4;
            return true;
        case TextEncoding::SHIFT_JIS:
            return converter_->convert(scalar, out, len);
        default:
            return false;
    }
}

void ScalarEncoder::write(const uint8_t* data, size_t len) {
    stream_write(sink_, data, len);
    bytes_written_ += len;
}

void ScalarEncoder::encode(char32_t scalar) {
    uint8_t bytes[MAX_SCALAR_BYTES];
    size_t len = 0;
    if (!is_unicode_scalar(scalar) || !to_bytes(scalar, bytes, len)) {
        throw CsvException(CsvError(ErrorCode::INVALID_SCALAR,
                                    format_scalar(scalar) + " cannot be encoded in " +
                                        encoding_to_string(encoding_))
                               .with_scalar(scalar)
                               .with_offset(scalars_written_)
                               .with_detail("encoding", encoding_to_string(encoding_)));
    }
    write(bytes, len);
    ++scalars_written_;
}

void ScalarEncoder::encode(std::u32string_view text) {
    for (char32_t scalar : text) encode(scalar);
}

std::unique_ptr<ScalarEncoder> make_scalar_encoder(OutputSink& sink, TextEncoding encoding,
                                                   BomStrategy bom) {
    return std::make_unique<ScalarEncoder>(sink, encoding, bom_for(encoding, bom));
}

}  // namespace unicsv
