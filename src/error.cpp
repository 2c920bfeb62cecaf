#include "error.h"
#include <cstdio>
#include <sstream>

namespace unicsv {

ErrorCategory error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return ErrorCategory::NONE;
        case ErrorCode::INVALID_DELIMITER:
        case ErrorCode::INVALID_CONFIGURATION: return ErrorCategory::CONFIGURATION;
        case ErrorCode::INFERENCE_FAILED: return ErrorCategory::INFERENCE;
        case ErrorCode::INVALID_QUOTE_ESCAPE:
        case ErrorCode::UNCLOSED_QUOTE:
        case ErrorCode::INVALID_UTF8:
        case ErrorCode::INVALID_UTF16:
        case ErrorCode::INVALID_UTF32: return ErrorCategory::MALFORMED_INPUT;
        case ErrorCode::BUFFER_FAILURE:
        case ErrorCode::INVALID_PATH: return ErrorCategory::BUFFER;
        case ErrorCode::INVALID_SCALAR:
        case ErrorCode::UNSUPPORTED_ENCODING: return ErrorCategory::ENCODING;
        case ErrorCode::STREAM_NOT_OPEN:
        case ErrorCode::STREAM_FAILED:
        case ErrorCode::STREAM_EMPTY_WRITE: return ErrorCategory::STREAM;
        case ErrorCode::IO_ERROR:
        case ErrorCode::INTERNAL_ERROR: return ErrorCategory::IO;
    }
    return ErrorCategory::IO;
}

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::INVALID_DELIMITER: return "INVALID_DELIMITER";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::INFERENCE_FAILED: return "INFERENCE_FAILED";
        case ErrorCode::INVALID_QUOTE_ESCAPE: return "INVALID_QUOTE_ESCAPE";
        case ErrorCode::UNCLOSED_QUOTE: return "UNCLOSED_QUOTE";
        case ErrorCode::INVALID_UTF8: return "INVALID_UTF8";
        case ErrorCode::INVALID_UTF16: return "INVALID_UTF16";
        case ErrorCode::INVALID_UTF32: return "INVALID_UTF32";
        case ErrorCode::BUFFER_FAILURE: return "BUFFER_FAILURE";
        case ErrorCode::INVALID_PATH: return "INVALID_PATH";
        case ErrorCode::INVALID_SCALAR: return "INVALID_SCALAR";
        case ErrorCode::UNSUPPORTED_ENCODING: return "UNSUPPORTED_ENCODING";
        case ErrorCode::STREAM_NOT_OPEN: return "STREAM_NOT_OPEN";
        case ErrorCode::STREAM_FAILED: return "STREAM_FAILED";
        case ErrorCode::STREAM_EMPTY_WRITE: return "STREAM_EMPTY_WRITE";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::CONFIGURATION: return "CONFIGURATION";
        case ErrorCategory::INFERENCE: return "INFERENCE";
        case ErrorCategory::MALFORMED_INPUT: return "MALFORMED_INPUT";
        case ErrorCategory::BUFFER: return "BUFFER";
        case ErrorCategory::ENCODING: return "ENCODING";
        case ErrorCategory::STREAM: return "STREAM";
        case ErrorCategory::IO: return "IO";
        default: return "UNKNOWN";
    }
}

std::string format_scalar(char32_t scalar) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(scalar));
    return buf;
}

std::string CsvError::detail(const std::string& key) const {
    for (const auto& kv : details) {
        if (kv.first == key) return kv.second;
    }
    return "";
}

std::string CsvError::to_string() const {
    std::ostringstream ss;
    ss << "[" << error_category_to_string(error_category(code)) << "] "
       << error_code_to_string(code);

    if (row) {
        ss << " at row " << *row;
        if (column) ss << ", column " << *column;
    }
    if (offset > 0) {
        ss << " (offset " << offset << ")";
    }
    ss << ": " << message;

    if (scalar) {
        ss << "\n  Scalar: " << format_scalar(*scalar);
    }
    for (const auto& kv : details) {
        ss << "\n  " << kv.first << ": " << kv.second;
    }
    if (!help.empty()) {
        ss << "\n  Help: " << help;
    }

    return ss.str();
}

} // namespace unicsv
