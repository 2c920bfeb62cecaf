/**
 * @file dialect.cpp
 * @brief Reader configuration resolution and delimiter/header inference.
 */

#include "dialect.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <initializer_list>
#include <map>

#include "debug.h"
#include "error.h"
#include "utf8.h"

namespace unicsv {

std::string Delimiters::to_string() const {
    return "Delimiters{field='" + escape_scalars(field) + "', row='" + escape_scalars(row) + "'}";
}

void Delimiters::validate() const {
    if (field.empty()) {
        throw CsvException(CsvError(ErrorCode::INVALID_DELIMITER, "Field delimiter is empty",
                                    "Use a non-empty delimiter such as ','"));
    }
    if (row.empty()) {
        throw CsvException(CsvError(ErrorCode::INVALID_DELIMITER, "Row delimiter is empty",
                                    "Use a non-empty delimiter such as '\\n'"));
    }
    if (field == row) {
        throw CsvException(CsvError(ErrorCode::INVALID_DELIMITER,
                                    "Field and row delimiters are both '" +
                                        escape_scalars(field) + "'",
                                    "Field and row delimiters must differ")
                               .with_detail("delimiters", to_string()));
    }
    for (const std::u32string* d : {&field, &row}) {
        if (d->find(QUOTE_SCALAR) != std::u32string::npos) {
            throw CsvException(CsvError(ErrorCode::INVALID_DELIMITER,
                                        "Delimiter '" + escape_scalars(*d) +
                                            "' contains the quote character",
                                        "The quote character '\"' is reserved for escaping")
                                   .with_scalar(QUOTE_SCALAR));
        }
    }
}

void ReaderConfig::validate() const {
    delimiters.validate();
    for (char32_t scalar : trim_scalars) {
        if (scalar == QUOTE_SCALAR) {
            throw CsvException(CsvError(ErrorCode::INVALID_CONFIGURATION,
                                        "Trim set contains the quote character",
                                        "Remove '\"' from the trim set")
                                   .with_scalar(scalar));
        }
        if (scalar == delimiters.field.front() || scalar == delimiters.row.front()) {
            throw CsvException(CsvError(ErrorCode::INVALID_CONFIGURATION,
                                        "Trim set contains the first character of a delimiter",
                                        "Trimmed characters would swallow delimiters")
                                   .with_scalar(scalar)
                                   .with_detail("delimiters", delimiters.to_string()));
        }
    }
}

namespace {

std::u32string trim_scalars_for(const ReaderOptions& options) {
    switch (options.trim) {
        case TrimStrategy::NONE:
            return {};
        case TrimStrategy::WHITESPACES:
            return U" \t";
        case TrimStrategy::SET:
            return options.trim_set;
    }
    return {};
}

bool matches_at(std::u32string_view text, size_t pos, const std::u32string& needle) {
    return text.size() - pos >= needle.size() && text.compare(pos, needle.size(), needle) == 0;
}

}  // namespace

ReaderConfig ReaderConfig::resolve(const ReaderOptions& options, ScalarSource& source,
                                   ScalarBuffer& buffer, const DetectionOptions& detection) {
    auto& trace = debug::global_trace();
    ScopedPhaseTimer timer(trace, "resolve configuration");

    // Explicit delimiters are checked before anything is read
    if (options.field_delimiter && options.field_delimiter->empty()) {
        Delimiters{*options.field_delimiter, U"\n"}.validate();
    }
    if (options.row_delimiter && options.row_delimiter->empty()) {
        Delimiters{U",", *options.row_delimiter}.validate();
    }
    if (options.field_delimiter && options.row_delimiter) {
        Delimiters{*options.field_delimiter, *options.row_delimiter}.validate();
    }

    DialectDetector detector(detection);
    ReaderConfig config;
    if (options.field_delimiter && options.row_delimiter) {
        config.delimiters = {*options.field_delimiter, *options.row_delimiter};
    } else if (options.row_delimiter) {
        config.delimiters = detector.infer_field_delimiter(source, buffer, *options.row_delimiter);
    } else if (options.field_delimiter) {
        config.delimiters = detector.infer_row_delimiter(source, buffer, *options.field_delimiter);
    } else {
        config.delimiters = detector.infer_delimiters(source, buffer);
    }
    config.trim_scalars = trim_scalars_for(options);
    config.validate();

    switch (options.header) {
        case HeaderStrategy::NONE:
            config.has_header = false;
            break;
        case HeaderStrategy::FIRST_LINE:
            config.has_header = true;
            break;
        case HeaderStrategy::UNKNOWN:
            config.has_header = detector.infer_header(source, buffer, config.delimiters);
            break;
    }

    if (trace.enabled()) {
        trace.log_delimiters(escape_scalars(config.delimiters.field),
                             escape_scalars(config.delimiters.row), config.has_header);
    }
    return config;
}

DialectDetector::DialectDetector(const DetectionOptions& options) : options_(options) {}

void DialectDetector::fail(const std::string& message) const {
    throw CsvException(CsvError(ErrorCode::INFERENCE_FAILED, message,
                                "Specify the delimiters and header explicitly")
                           .with_detail("min_rows", std::to_string(options_.min_rows)));
}

std::vector<std::u32string_view>
DialectDetector::find_rows(std::u32string_view sample, const std::u32string& row_delimiter,
                           bool complete) const {
    std::vector<std::u32string_view> rows;
    bool in_quote = false;
    size_t row_start = 0;
    size_t i = 0;
    while (i < sample.size() && rows.size() < options_.max_rows) {
        if (sample[i] == QUOTE_SCALAR) {
            in_quote = !in_quote;
            ++i;
        } else if (!in_quote && matches_at(sample, i, row_delimiter)) {
            if (i > row_start) rows.push_back(sample.substr(row_start, i - row_start));
            i += row_delimiter.size();
            row_start = i;
        } else {
            ++i;
        }
    }
    if (complete && rows.size() < options_.max_rows && row_start < sample.size()) {
        rows.push_back(sample.substr(row_start));
    }
    return rows;
}

std::vector<std::string> DialectDetector::extract_fields(std::u32string_view row,
                                                         const std::u32string& field_delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quote = false;
    size_t i = 0;
    while (i < row.size()) {
        char32_t c = row[i];
        if (c == QUOTE_SCALAR) {
            if (in_quote && i + 1 < row.size() && row[i + 1] == QUOTE_SCALAR) {
                current += '"';
                i += 2;
                continue;
            }
            in_quote = !in_quote;
            ++i;
        } else if (!in_quote && matches_at(row, i, field_delimiter)) {
            fields.push_back(std::move(current));
            current.clear();
            i += field_delimiter.size();
        } else {
            utf8_append(current, c);
            ++i;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

DialectDetector::Candidate DialectDetector::score(const Delimiters& delimiters,
                                                  const std::u32string& sample,
                                                  bool complete) const {
    Candidate candidate;
    candidate.delimiters = delimiters;

    auto rows = find_rows(sample, delimiters.row, complete);
    candidate.rows = rows.size();
    if (rows.size() < options_.min_rows) return candidate;

    std::map<size_t, size_t> counts;
    for (auto row : rows) {
        counts[extract_fields(row, delimiters.field).size()]++;
    }
    // Modal field count; the larger count wins a tie
    size_t modal = 0;
    size_t modal_rows = 0;
    for (const auto& [fields, n] : counts) {
        if (n >= modal_rows) {
            modal = fields;
            modal_rows = n;
        }
    }
    candidate.num_columns = modal;
    candidate.score = static_cast<double>(modal_rows) / rows.size();
    return candidate;
}

Delimiters DialectDetector::pick(std::vector<Candidate>& candidates, const char* what) const {
    auto& trace = debug::global_trace();
    const Candidate* best = nullptr;
    for (const auto& c : candidates) {
        if (trace.verbose()) {
            trace.log("  candidate %s: score=%.4f columns=%zu rows=%zu",
                      c.delimiters.to_string().c_str(), c.score, c.num_columns, c.rows);
        }
        if (c.score <= 0.0) continue;
        if (!best || c.score > best->score ||
            (c.score == best->score && c.num_columns > best->num_columns)) {
            best = &c;
        }
    }
    if (!best) {
        fail(std::string("Could not infer the ") + what + ": no candidate splits at least " +
             std::to_string(options_.min_rows) + " rows consistently");
    }
    if (trace.enabled()) {
        trace.log_decision(what, best->delimiters.to_string().c_str());
    }
    return best->delimiters;
}

Delimiters DialectDetector::infer_field_delimiter(ScalarSource& source, ScalarBuffer& buffer,
                                                  const std::u32string& row_delimiter) const {
    Lookahead lookahead(source, buffer);
    auto [sample, complete] = lookahead.read_sample(options_.sample_size);

    std::vector<Candidate> candidates;
    for (const auto& field : options_.field_candidates) {
        if (field == row_delimiter) continue;
        Candidate c = score({field, row_delimiter}, sample, complete);
        if (c.num_columns < 2) c.score = 0.0;
        candidates.push_back(c);
    }
    return pick(candidates, "field delimiter");
}

Delimiters DialectDetector::infer_row_delimiter(ScalarSource& source, ScalarBuffer& buffer,
                                                const std::u32string& field_delimiter) const {
    Lookahead lookahead(source, buffer);
    auto [sample, complete] = lookahead.read_sample(options_.sample_size);

    // The field delimiter is known, so single-column data is acceptable here
    std::vector<Candidate> candidates;
    for (const auto& row : options_.row_candidates) {
        if (row == field_delimiter) continue;
        candidates.push_back(score({field_delimiter, row}, sample, complete));
    }
    return pick(candidates, "row delimiter");
}

Delimiters DialectDetector::infer_delimiters(ScalarSource& source, ScalarBuffer& buffer) const {
    Lookahead lookahead(source, buffer);
    auto [sample, complete] = lookahead.read_sample(options_.sample_size);

    std::vector<Candidate> candidates;
    for (const auto& row : options_.row_candidates) {
        for (const auto& field : options_.field_candidates) {
            if (field == row) continue;
            Candidate c = score({field, row}, sample, complete);
            if (c.num_columns < 2) c.score = 0.0;
            candidates.push_back(c);
        }
    }
    return pick(candidates, "delimiters");
}

bool DialectDetector::infer_header(ScalarSource& source, ScalarBuffer& buffer,
                                   const Delimiters& delimiters) const {
    Lookahead lookahead(source, buffer);
    auto [sample, complete] = lookahead.read_sample(options_.sample_size);
    auto& trace = debug::global_trace();

    auto rows = find_rows(sample, delimiters.row, complete);
    if (rows.size() < 2) {
        fail("Could not infer the header: the sample holds " + std::to_string(rows.size()) +
             " row(s)");
    }

    auto header_fields = extract_fields(rows[0], delimiters.field);
    std::vector<std::vector<std::string>> data;
    data.reserve(rows.size() - 1);
    for (size_t r = 1; r < rows.size(); ++r) {
        data.push_back(extract_fields(rows[r], delimiters.field));
    }

    size_t header_strings = 0;
    size_t header_non_empty = 0;
    for (const auto& field : header_fields) {
        if (infer_cell_type(field) == CellType::STRING) header_strings++;
        if (!field.empty()) header_non_empty++;
    }

    size_t typed_below = 0;
    bool repeats = false;
    for (const auto& row : data) {
        for (size_t col = 0; col < row.size() && col < header_fields.size(); ++col) {
            CellType type = infer_cell_type(row[col]);
            if (type != CellType::STRING && type != CellType::EMPTY) typed_below++;
            if (row[col] == header_fields[col]) repeats = true;
        }
    }

    double string_ratio =
        header_non_empty > 0 ? static_cast<double>(header_strings) / header_non_empty : 0.0;
    bool all_strings = header_strings == header_fields.size();
    bool has_header = string_ratio > 0.5 && (typed_below > 0 || (all_strings && !repeats));

    if (trace.enabled()) {
        char reason[160];
        snprintf(reason, sizeof(reason),
                 "string ratio %.2f, %zu typed cell(s) below, first row %s", string_ratio,
                 typed_below, repeats ? "repeats" : "is unique");
        trace.log_decision(has_header ? "header present" : "no header", reason);
    }
    return has_header;
}

DialectDetector::CellType DialectDetector::infer_cell_type(std::string_view cell) {
    while (!cell.empty() && std::isspace(static_cast<unsigned char>(cell.front()))) {
        cell.remove_prefix(1);
    }
    while (!cell.empty() && std::isspace(static_cast<unsigned char>(cell.back()))) {
        cell.remove_suffix(1);
    }
    if (cell.empty()) return CellType::EMPTY;

    if (cell == "true" || cell == "false" || cell == "TRUE" || cell == "FALSE" ||
        cell == "True" || cell == "False") {
        return CellType::BOOLEAN;
    }

    auto digit = [&](size_t i) { return std::isdigit(static_cast<unsigned char>(cell[i])) != 0; };

    // Integer, then float with optional fraction and exponent
    {
        size_t i = (cell[0] == '+' || cell[0] == '-') ? 1 : 0;
        size_t start = i;
        while (i < cell.size() && digit(i)) i++;
        if (i > start && i == cell.size()) return CellType::INTEGER;

        bool has_digits = i > start;
        bool has_dot = false;
        bool has_exp = false;
        bool valid = true;
        if (i < cell.size() && cell[i] == '.') {
            has_dot = true;
            i++;
            while (i < cell.size() && digit(i)) {
                has_digits = true;
                i++;
            }
        }
        if (i < cell.size() && (cell[i] == 'e' || cell[i] == 'E')) {
            has_exp = true;
            i++;
            if (i < cell.size() && (cell[i] == '+' || cell[i] == '-')) i++;
            size_t exp_start = i;
            while (i < cell.size() && digit(i)) i++;
            if (i == exp_start) valid = false;
        }
        if (valid && has_digits && (has_dot || has_exp) && i == cell.size()) {
            return CellType::FLOAT;
        }
    }

    // YYYY-MM-DD, YYYY/MM/DD, DD-MM-YYYY, DD/MM/YYYY
    if (cell.size() == 10) {
        bool ymd = digit(0) && digit(1) && digit(2) && digit(3) && (cell[4] == '-' || cell[4] == '/') &&
                   digit(5) && digit(6) && cell[7] == cell[4] && digit(8) && digit(9);
        bool dmy = digit(0) && digit(1) && (cell[2] == '-' || cell[2] == '/') && digit(3) &&
                   digit(4) && cell[5] == cell[2] && digit(6) && digit(7) && digit(8) && digit(9);
        if (ymd || dmy) return CellType::DATE;
    }

    // HH:MM or HH:MM:SS
    if ((cell.size() == 5 || cell.size() == 8) && digit(0) && digit(1) && cell[2] == ':' &&
        digit(3) && digit(4)) {
        if (cell.size() == 5 || (cell[5] == ':' && digit(6) && digit(7))) return CellType::TIME;
    }

    return CellType::STRING;
}

const char* DialectDetector::cell_type_to_string(CellType type) {
    switch (type) {
        case CellType::EMPTY:
            return "EMPTY";
        case CellType::INTEGER:
            return "INTEGER";
        case CellType::FLOAT:
            return "FLOAT";
        case CellType::DATE:
            return "DATE";
        case CellType::TIME:
            return "TIME";
        case CellType::BOOLEAN:
            return "BOOLEAN";
        case CellType::STRING:
            return "STRING";
    }
    return "UNKNOWN";
}

}  // namespace unicsv
