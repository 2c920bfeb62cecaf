#include "encoding.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>
#include <string>

namespace unicsv {

const char* encoding_to_string(TextEncoding enc) {
    switch (enc) {
        case TextEncoding::ASCII:        return "ASCII";
        case TextEncoding::UTF8:         return "UTF-8";
        case TextEncoding::UTF16:        return "UTF-16";
        case TextEncoding::UTF16_BE:     return "UTF-16BE";
        case TextEncoding::UTF16_LE:     return "UTF-16LE";
        case TextEncoding::UTF32:        return "UTF-32";
        case TextEncoding::UTF32_BE:     return "UTF-32BE";
        case TextEncoding::UTF32_LE:     return "UTF-32LE";
        case TextEncoding::SHIFT_JIS:    return "Shift_JIS";
        case TextEncoding::LATIN1:       return "Latin-1";
        case TextEncoding::WINDOWS_1252: return "Windows-1252";
        case TextEncoding::ISO_2022_JP:  return "ISO-2022-JP";
        case TextEncoding::UNKNOWN:      return "Unknown";
    }
    return "Unknown";
}

std::optional<TextEncoding> parse_encoding(std::string_view name) {
    std::string key;
    for (char c : name) {
        if (c == '-' || c == '_') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    struct Alias { const char* name; TextEncoding encoding; };
    static const Alias aliases[] = {
        {"ascii", TextEncoding::ASCII},
        {"usascii", TextEncoding::ASCII},
        {"utf8", TextEncoding::UTF8},
        {"utf16", TextEncoding::UTF16},
        {"unicode", TextEncoding::UTF16},
        {"utf16be", TextEncoding::UTF16_BE},
        {"utf16le", TextEncoding::UTF16_LE},
        {"utf32", TextEncoding::UTF32},
        {"utf32be", TextEncoding::UTF32_BE},
        {"utf32le", TextEncoding::UTF32_LE},
        {"shiftjis", TextEncoding::SHIFT_JIS},
        {"sjis", TextEncoding::SHIFT_JIS},
        {"latin1", TextEncoding::LATIN1},
        {"iso88591", TextEncoding::LATIN1},
        {"windows1252", TextEncoding::WINDOWS_1252},
        {"cp1252", TextEncoding::WINDOWS_1252},
        {"iso2022jp", TextEncoding::ISO_2022_JP},
    };
    for (const auto& alias : aliases) {
        if (key == alias.name) return alias.encoding;
    }
    return std::nullopt;
}

bool is_supported_output(TextEncoding enc) {
    switch (enc) {
        case TextEncoding::ASCII:
        case TextEncoding::UTF8:
        case TextEncoding::UTF16:
        case TextEncoding::UTF16_BE:
        case TextEncoding::UTF16_LE:
        case TextEncoding::UTF32:
        case TextEncoding::UTF32_BE:
        case TextEncoding::UTF32_LE:
        case TextEncoding::SHIFT_JIS:
            return true;
        default:
            return false;
    }
}

// BOM (Byte Order Mark) patterns
static constexpr uint8_t UTF8_BOM[] = {0xEF, 0xBB, 0xBF};
static constexpr uint8_t UTF16_LE_BOM[] = {0xFF, 0xFE};
static constexpr uint8_t UTF16_BE_BOM[] = {0xFE, 0xFF};
static constexpr uint8_t UTF32_LE_BOM[] = {0xFF, 0xFE, 0x00, 0x00};
static constexpr uint8_t UTF32_BE_BOM[] = {0x00, 0x00, 0xFE, 0xFF};

std::vector<uint8_t> bom_for(TextEncoding enc, BomStrategy strategy) {
    if (strategy == BomStrategy::NEVER) return {};

    switch (enc) {
        case TextEncoding::UTF16:
            return {std::begin(UTF16_BE_BOM), std::end(UTF16_BE_BOM)};
        case TextEncoding::UTF32:
            return {std::begin(UTF32_BE_BOM), std::end(UTF32_BE_BOM)};
        default:
            break;
    }
    if (strategy == BomStrategy::CONVENTION) return {};

    switch (enc) {
        case TextEncoding::UTF8:
            return {std::begin(UTF8_BOM), std::end(UTF8_BOM)};
        case TextEncoding::UTF16_BE:
            return {std::begin(UTF16_BE_BOM), std::end(UTF16_BE_BOM)};
        case TextEncoding::UTF16_LE:
            return {std::begin(UTF16_LE_BOM), std::end(UTF16_LE_BOM)};
        case TextEncoding::UTF32_BE:
            return {std::begin(UTF32_BE_BOM), std::end(UTF32_BE_BOM)};
        case TextEncoding::UTF32_LE:
            return {std::begin(UTF32_LE_BOM), std::end(UTF32_LE_BOM)};
        default:
            return {};
    }
}

// Check if buffer starts with a specific BOM
static bool has_bom(const uint8_t* buf, size_t len,
                    const uint8_t* bom, size_t bom_len) {
    if (len < bom_len) return false;
    return std::memcmp(buf, bom, bom_len) == 0;
}

// Detect encoding via BOM
static std::optional<EncodingResult> detect_bom(const uint8_t* buf, size_t len) {
    EncodingResult result;
    result.confidence = 1.0;  // BOM detection is definitive

    // Check UTF-32 first (4 bytes) since UTF-32 LE BOM starts with FF FE
    // which is the same as UTF-16 LE BOM
    if (has_bom(buf, len, UTF32_LE_BOM, 4)) {
        result.encoding = TextEncoding::UTF32_LE;
        result.bom_length = 4;
        return result;
    }
    if (has_bom(buf, len, UTF32_BE_BOM, 4)) {
        result.encoding = TextEncoding::UTF32_BE;
        result.bom_length = 4;
        return result;
    }
    if (has_bom(buf, len, UTF16_LE_BOM, 2)) {
        result.encoding = TextEncoding::UTF16_LE;
        result.bom_length = 2;
        return result;
    }
    if (has_bom(buf, len, UTF16_BE_BOM, 2)) {
        result.encoding = TextEncoding::UTF16_BE;
        result.bom_length = 2;
        return result;
    }
    if (has_bom(buf, len, UTF8_BOM, 3)) {
        result.encoding = TextEncoding::UTF8;
        result.bom_length = 3;
        return result;
    }
    return std::nullopt;
}

// Heuristic detection when no BOM is present
static EncodingResult detect_heuristic(const uint8_t* buf, size_t len) {
    EncodingResult result;

    // Sample size for heuristic detection (first 4KB or entire input)
    const size_t sample_size = std::min(len, size_t(4096));

    size_t null_count = 0;
    size_t even_nulls = 0;  // Nulls at even byte positions (0, 2, 4, ...)
    size_t odd_nulls = 0;   // Nulls at odd byte positions (1, 3, 5, ...)

    for (size_t i = 0; i < sample_size; ++i) {
        if (buf[i] == 0) {
            ++null_count;
            if (i % 2 == 0) ++even_nulls;
            else ++odd_nulls;
        }
    }

    // UTF-32 detection: Check for pattern of 3 nulls per 4 bytes
    if (sample_size >= 4 && len % 4 == 0) {
        size_t utf32_le_score = 0;
        size_t utf32_be_score = 0;
        size_t check_count = std::min(sample_size / 4, size_t(256));

        for (size_t i = 0; i < check_count; ++i) {
            size_t offset = i * 4;
            // UTF-32 LE: byte, 0, 0, 0 for ASCII
            if (buf[offset] != 0 && buf[offset + 1] == 0 &&
                buf[offset + 2] == 0 && buf[offset + 3] == 0) {
                ++utf32_le_score;
            }
            // UTF-32 BE: 0, 0, 0, byte for ASCII
            if (buf[offset] == 0 && buf[offset + 1] == 0 &&
                buf[offset + 2] == 0 && buf[offset + 3] != 0) {
                ++utf32_be_score;
            }
        }

        double le_ratio = static_cast<double>(utf32_le_score) / check_count;
        double be_ratio = static_cast<double>(utf32_be_score) / check_count;
        if (le_ratio > 0.5) {
            result.encoding = TextEncoding::UTF32_LE;
            result.confidence = le_ratio;
            return result;
        }
        if (be_ratio > 0.5) {
            result.encoding = TextEncoding::UTF32_BE;
            result.confidence = be_ratio;
            return result;
        }
    }

    // UTF-16 detection: Check for alternating null bytes
    if (len % 2 == 0 && null_count > 0) {
        double null_ratio = static_cast<double>(null_count) / sample_size;

        // UTF-16 typically has ~50% null bytes for ASCII content
        if (null_ratio > 0.2 && null_ratio < 0.7) {
            if (odd_nulls > even_nulls * 3) {
                result.encoding = TextEncoding::UTF16_LE;
                result.confidence = 0.8;
                return result;
            }
            if (even_nulls > odd_nulls * 3) {
                result.encoding = TextEncoding::UTF16_BE;
                result.confidence = 0.8;
                return result;
            }
        }
    }

    // Default to UTF-8; the source rejects invalid sequences while reading
    result.encoding = TextEncoding::UTF8;
    result.confidence = null_count == 0 ? 0.9 : 0.5;
    return result;
}

EncodingResult detect_encoding(const uint8_t* buf, size_t len) {
    if (buf == nullptr || len == 0) {
        return {TextEncoding::UTF8, 0, 1.0};
    }

    if (auto bom = detect_bom(buf, len)) {
        return *bom;
    }
    return detect_heuristic(buf, len);
}

}  // namespace unicsv
