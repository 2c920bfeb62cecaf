#ifndef UNICSV_ERROR_H
#define UNICSV_ERROR_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace unicsv {

// CSV Error Types
enum class ErrorCode {
    NONE = 0,

    // Configuration errors
    INVALID_DELIMITER,           // Empty delimiter, or field delimiter == row delimiter
    INVALID_CONFIGURATION,       // Quote or trim settings clash with the delimiters

    // Inference errors
    INFERENCE_FAILED,            // Sample too small to infer delimiters/header

    // Malformed input
    INVALID_QUOTE_ESCAPE,        // Text after a closing quote before a delimiter
    UNCLOSED_QUOTE,              // Quoted field not closed before end of input
    INVALID_UTF8,                // Invalid UTF-8 sequence in the source
    INVALID_UTF16,               // Unpaired surrogate or truncated UTF-16 unit
    INVALID_UTF32,               // Out-of-range or truncated UTF-32 unit

    // Decoding buffer errors
    BUFFER_FAILURE,              // Requested row was discarded by the retention policy
    INVALID_PATH,                // Row, column or key does not exist

    // Encoding errors
    INVALID_SCALAR,              // Code point not representable in the encoding
    UNSUPPORTED_ENCODING,        // Encoding not supported by the scalar encoder

    // Stream errors
    STREAM_NOT_OPEN,             // Sink was not open before the first write
    STREAM_FAILED,               // Sink reported an explicit error
    STREAM_EMPTY_WRITE,          // Sink made no progress within the retry budget

    // General errors
    IO_ERROR,                    // File I/O error
    INTERNAL_ERROR               // Internal parser error
};

// Taxonomy the codes above fall into
enum class ErrorCategory {
    NONE,
    CONFIGURATION,
    INFERENCE,
    MALFORMED_INPUT,
    BUFFER,
    ENCODING,
    STREAM,
    IO
};

// Detailed error information
struct CsvError {
    ErrorCode code = ErrorCode::NONE;

    std::string message;  // Human-readable error message
    std::string help;     // What the caller can do about it

    // Location information (absent when not applicable)
    std::optional<size_t> row;        // Row index (0-based, data rows)
    std::optional<size_t> column;     // Field index within the row (0-based)
    std::optional<char32_t> scalar;   // Offending code point
    size_t offset = 0;                // Scalars (or bytes, for sources) consumed

    // Extra context: encoding name, stream status, errno text, attempts...
    std::vector<std::pair<std::string, std::string>> details;

    CsvError() = default;
    CsvError(ErrorCode c, std::string msg, std::string hint = "")
        : code(c), message(std::move(msg)), help(std::move(hint)) {}

    CsvError& at(size_t r, size_t col) {
        row = r;
        column = col;
        return *this;
    }

    CsvError& with_scalar(char32_t s) {
        scalar = s;
        return *this;
    }

    CsvError& with_offset(size_t o) {
        offset = o;
        return *this;
    }

    CsvError& with_detail(std::string key, std::string value) {
        details.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    // Value of a detail entry, or empty string
    std::string detail(const std::string& key) const;

    // Convert error to string
    std::string to_string() const;
};

// Exception thrown for every fatal parse, buffer, encoding or stream error
class CsvException : public std::runtime_error {
public:
    explicit CsvException(const CsvError& error)
        : std::runtime_error(error.to_string()), error_(error) {}

    const CsvError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    CsvError error_;
};

// Helper functions
ErrorCategory error_category(ErrorCode code);
const char* error_code_to_string(ErrorCode code);
const char* error_category_to_string(ErrorCategory category);

// "U+00E9" style rendering of a code point
std::string format_scalar(char32_t scalar);

} // namespace unicsv

#endif // UNICSV_ERROR_H
