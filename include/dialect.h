/**
 * @file dialect.h
 * @brief Reader configuration and delimiter/header inference.
 *
 * ReaderOptions may leave the field delimiter, the row delimiter or the
 * header presence open. ReaderConfig::resolve() fills the gaps with the
 * DialectDetector, which samples the input through the pushback buffer and
 * restores every scalar it read, so the parser still sees the whole stream.
 *
 * @see DialectDetector for the inference heuristics
 * @see ReaderConfig for the resolved, immutable configuration
 */

#ifndef UNICSV_DIALECT_H
#define UNICSV_DIALECT_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "scalar_buffer.h"
#include "scalar_source.h"

namespace unicsv {

/// The quote scalar; also escapes itself when doubled inside a quoted field
constexpr char32_t QUOTE_SCALAR = U'"';

/**
 * @brief Field and row delimiters, each a non-empty scalar sequence.
 */
struct Delimiters {
    std::u32string field = U",";
    std::u32string row = U"\n";

    bool operator==(const Delimiters& other) const {
        return field == other.field && row == other.row;
    }
    bool operator!=(const Delimiters& other) const {
        return !(*this == other);
    }

    /// @throws CsvException INVALID_DELIMITER when empty, equal or containing the quote
    void validate() const;

    /// Returns a human-readable description, e.g. "Delimiters{field=',', row='\n'}"
    std::string to_string() const;
};

/// Whether the first row holds column names
enum class HeaderStrategy {
    NONE,        ///< No header row
    FIRST_LINE,  ///< The first row is the header
    UNKNOWN      ///< Infer from the data
};

/// Scalars stripped from both ends of unquoted fields
enum class TrimStrategy {
    NONE,
    WHITESPACES,  ///< Space and horizontal tab
    SET           ///< The scalars in ReaderOptions::trim_set
};

/**
 * @brief Reader settings as given by the caller; gaps are inferred.
 */
struct ReaderOptions {
    /// Unset means "infer from the input"
    std::optional<std::u32string> field_delimiter = std::u32string(U",");
    std::optional<std::u32string> row_delimiter = std::u32string(U"\n");

    HeaderStrategy header = HeaderStrategy::NONE;

    TrimStrategy trim = TrimStrategy::NONE;
    std::u32string trim_set;  ///< Used with TrimStrategy::SET

    /// Factory leaving both delimiters and the header to inference
    static ReaderOptions inferred() {
        ReaderOptions options;
        options.field_delimiter.reset();
        options.row_delimiter.reset();
        options.header = HeaderStrategy::UNKNOWN;
        return options;
    }
};

/**
 * @brief Configuration options for inference.
 */
struct DetectionOptions {
    size_t sample_size = 16384;   ///< Scalars to sample
    size_t min_rows = 2;          ///< Minimum rows needed for inference
    size_t max_rows = 100;        ///< Maximum rows to analyze

    /// Candidate field delimiters, in tie-break order
    std::vector<std::u32string> field_candidates = {U",", U";", U"\t", U"|", U":"};

    /// Candidate row delimiters, in tie-break order
    std::vector<std::u32string> row_candidates = {U"\r\n", U"\n", U"\r"};
};

class DialectDetector;

/**
 * @brief Resolved reader configuration; immutable for a parse session.
 */
struct ReaderConfig {
    Delimiters delimiters;
    bool has_header = false;
    std::u32string trim_scalars;            ///< Empty: no trimming
    char32_t escaping_scalar = QUOTE_SCALAR;

    bool trims() const { return !trim_scalars.empty(); }
    bool is_trim_scalar(char32_t scalar) const {
        return trim_scalars.find(scalar) != std::u32string::npos;
    }

    /// @throws CsvException INVALID_DELIMITER for bad delimiters, INVALID_CONFIGURATION
    ///         when the trim set holds the quote or a delimiter's first scalar
    void validate() const;

    /**
     * @brief Validate options and infer whatever they leave open.
     *
     * Inference reads through `buffer`; every scalar it consumed is back in
     * `buffer` when this returns or throws.
     *
     * @throws CsvException INVALID_DELIMITER / INVALID_CONFIGURATION for
     *         unusable settings, INFERENCE_FAILED when the sample is too small
     */
    static ReaderConfig resolve(const ReaderOptions& options, ScalarSource& source,
                                ScalarBuffer& buffer,
                                const DetectionOptions& detection = DetectionOptions());
};

/**
 * @brief Delimiter and header inference over a sampled prefix.
 *
 * Every candidate is scored by how consistently it splits the sampled rows:
 * the fraction of rows having the modal field count. Candidates that never
 * split a row (modal count 1) score zero. Ties go to the larger column count,
 * then to the earlier candidate.
 *
 * @example
 * @code
 * unicsv::Utf8Source source("a;b\n1;2\n");
 * unicsv::ScalarBuffer buffer;
 * unicsv::DialectDetector detector;
 * auto delimiters = detector.infer_field_delimiter(source, buffer, U"\n");
 * // delimiters.field == U";" and buffer holds the sampled scalars again
 * @endcode
 */
class DialectDetector {
public:
    /// Cell type categories for header inference
    enum class CellType {
        EMPTY,
        INTEGER,
        FLOAT,
        DATE,
        TIME,
        BOOLEAN,
        STRING
    };

    /**
     * @brief Construct a detector with given options.
     * @param options Detection configuration
     */
    explicit DialectDetector(const DetectionOptions& options = DetectionOptions());

    /// Field delimiter given the row delimiter
    Delimiters infer_field_delimiter(ScalarSource& source, ScalarBuffer& buffer,
                                     const std::u32string& row_delimiter) const;

    /// Row delimiter given the field delimiter
    Delimiters infer_row_delimiter(ScalarSource& source, ScalarBuffer& buffer,
                                   const std::u32string& field_delimiter) const;

    /// Both delimiters at once
    Delimiters infer_delimiters(ScalarSource& source, ScalarBuffer& buffer) const;

    /// Whether the first row looks like a header, for resolved delimiters
    bool infer_header(ScalarSource& source, ScalarBuffer& buffer,
                      const Delimiters& delimiters) const;

    /**
     * @brief Infer the type of a cell value.
     * @param cell The cell content (UTF-8)
     * @return The inferred CellType
     */
    static CellType infer_cell_type(std::string_view cell);

    /**
     * @brief Convert CellType to string for debugging.
     */
    static const char* cell_type_to_string(CellType type);

private:
    DetectionOptions options_;

    struct Candidate {
        Delimiters delimiters;
        double score = 0.0;        ///< Fraction of rows with the modal field count
        size_t num_columns = 0;    ///< Modal field count
        size_t rows = 0;           ///< Rows in the sample
    };

    /// Score one delimiter pair against a sample
    Candidate score(const Delimiters& delimiters, const std::u32string& sample,
                    bool complete) const;

    /// Best candidate, or INFERENCE_FAILED
    Delimiters pick(std::vector<Candidate>& candidates, const char* what) const;

    /// Split a sample into rows honouring quotes; empty rows are dropped and
    /// a trailing partial row is dropped unless the sample is complete
    std::vector<std::u32string_view> find_rows(std::u32string_view sample,
                                               const std::u32string& row_delimiter,
                                               bool complete) const;

    /// Split a row into fields honouring quotes; quotes are removed
    static std::vector<std::string> extract_fields(std::u32string_view row,
                                                   const std::u32string& field_delimiter);

    /// Throw INFERENCE_FAILED for an insufficient sample
    [[noreturn]] void fail(const std::string& message) const;
};

}  // namespace unicsv

#endif  // UNICSV_DIALECT_H
