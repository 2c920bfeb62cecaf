#include "csv_reader.h"

#include <algorithm>

#include "debug.h"
#include "error.h"
#include "utf8.h"

namespace unicsv {

CsvReader::CsvReader(ScalarSource& source, const ReaderOptions& options,
                     const DetectionOptions& detection)
    : source_(source), config_(ReaderConfig::resolve(options, source, buffer_, detection)) {
    read_header();
}

CsvReader::CsvReader(ScalarSource& source, const ReaderConfig& config)
    : source_(source), config_(config) {
    config_.validate();
    read_header();
}

void CsvReader::read_header() {
    if (!config_.has_header) return;
    if (auto fields = parse_row()) {
        headers_ = std::move(*fields);
        auto& trace = debug::global_trace();
        if (trace.verbose()) {
            trace.log("header: %zu column(s)", headers_.size());
        }
    }
}

std::optional<size_t> CsvReader::header_index(std::string_view name) const {
    auto it = std::find(headers_.begin(), headers_.end(), name);
    if (it == headers_.end()) return std::nullopt;
    return static_cast<size_t>(it - headers_.begin());
}

std::optional<Row> CsvReader::read_row() {
    if (at_end_) return std::nullopt;
    auto fields = parse_row();
    if (!fields) return std::nullopt;
    Row row;
    row.index = rows_read_++;
    row.fields = std::move(*fields);
    return row;
}

std::vector<Row> CsvReader::read_all() {
    std::vector<Row> rows;
    while (auto row = read_row()) {
        rows.push_back(std::move(*row));
    }
    return rows;
}

std::optional<char32_t> CsvReader::next() {
    auto scalar = next_scalar(source_, buffer_);
    if (scalar) ++offset_;
    return scalar;
}

bool CsvReader::match_rest(const std::u32string& delimiter) {
    std::u32string extra;
    for (size_t i = 1; i < delimiter.size(); ++i) {
        auto scalar = next();
        if (!scalar) break;
        extra.push_back(*scalar);
        if (*scalar != delimiter[i]) break;
    }
    if (extra.size() + 1 == delimiter.size() && delimiter.compare(1, extra.size(), extra) == 0) {
        return true;
    }
    // Over-read scalars go back in front of the queue, in stream order
    buffer_.prepend(extra);
    offset_ -= extra.size();
    return false;
}

CsvReader::Match CsvReader::match_delimiter(char32_t first) {
    const auto& field = config_.delimiters.field;
    const auto& row = config_.delimiters.row;
    // The longer delimiter is tried first so a shared prefix cannot shadow it
    bool row_first = row.size() > field.size();
    const std::u32string& a = row_first ? row : field;
    const std::u32string& b = row_first ? field : row;
    Match match_a = row_first ? Match::ROW : Match::FIELD;
    Match match_b = row_first ? Match::FIELD : Match::ROW;

    if (first == a[0] && match_rest(a)) return match_a;
    if (first == b[0] && match_rest(b)) return match_b;
    return Match::NONE;
}

void CsvReader::finish_field(std::vector<std::string>& fields, std::u32string& field,
                             bool quoted) const {
    std::u32string_view view(field);
    if (!quoted && config_.trims()) {
        while (!view.empty() && config_.is_trim_scalar(view.front())) view.remove_prefix(1);
        while (!view.empty() && config_.is_trim_scalar(view.back())) view.remove_suffix(1);
    }
    fields.push_back(to_utf8(view));
    field.clear();
}

std::optional<std::vector<std::string>> CsvReader::parse_row() {
    auto& trace = debug::global_trace();
    const bool verbose = trace.verbose();

    std::vector<std::string> fields;
    std::u32string field;
    bool row_started = false;
    // Set once a trim scalar follows a closing quote; only delimiters may come next
    bool trimmed_after_quote = false;
    State state = State::BETWEEN_ROWS;

    auto transition = [&](State to, char32_t scalar) {
        if (verbose) {
            trace.log_state_transition(state_name(state), state_name(to), scalar, offset_);
        }
        state = to;
    };

    while (state != State::ROW_COMPLETE && state != State::END_OF_INPUT) {
        auto scalar = next();
        if (!scalar) {
            switch (state) {
                case State::BETWEEN_ROWS:
                    if (!row_started) {
                        at_end_ = true;
                        return std::nullopt;
                    }
                    finish_field(fields, field, false);
                    break;
                case State::IN_UNQUOTED_FIELD:
                    finish_field(fields, field, false);
                    break;
                case State::AFTER_CLOSING_QUOTE:
                    finish_field(fields, field, true);
                    break;
                case State::IN_QUOTED_FIELD:
                    throw CsvException(
                        CsvError(ErrorCode::UNCLOSED_QUOTE,
                                 "Quoted field is not closed before the end of input",
                                 "Close the field with '\"' or escape quotes as '\"\"'")
                            .at(rows_read_, fields.size())
                            .with_offset(offset_));
                default:
                    break;
            }
            at_end_ = true;
            transition(State::END_OF_INPUT, U'\0');
            continue;
        }

        char32_t c = *scalar;
        switch (state) {
            case State::BETWEEN_ROWS:
                if (c == config_.escaping_scalar) {
                    row_started = true;
                    transition(State::IN_QUOTED_FIELD, c);
                } else if (config_.trims() && config_.is_trim_scalar(c)) {
                    row_started = true;
                } else {
                    Match match = match_delimiter(c);
                    if (match == Match::FIELD) {
                        row_started = true;
                        finish_field(fields, field, false);
                    } else if (match == Match::ROW) {
                        if (!row_started) break;  // empty line
                        finish_field(fields, field, false);
                        state = State::ROW_COMPLETE;
                    } else {
                        row_started = true;
                        field.push_back(c);
                        state = State::IN_UNQUOTED_FIELD;
                    }
                }
                break;

            case State::IN_UNQUOTED_FIELD: {
                // A quote inside an unquoted field is kept as text
                Match match = match_delimiter(c);
                if (match == Match::FIELD) {
                    finish_field(fields, field, false);
                    state = State::BETWEEN_ROWS;
                } else if (match == Match::ROW) {
                    finish_field(fields, field, false);
                    state = State::ROW_COMPLETE;
                } else {
                    field.push_back(c);
                }
                break;
            }

            case State::IN_QUOTED_FIELD:
                if (c == config_.escaping_scalar) {
                    trimmed_after_quote = false;
                    transition(State::AFTER_CLOSING_QUOTE, c);
                } else {
                    field.push_back(c);
                }
                break;

            case State::AFTER_CLOSING_QUOTE: {
                if (c == config_.escaping_scalar && !trimmed_after_quote) {
                    field.push_back(c);
                    transition(State::IN_QUOTED_FIELD, c);
                    break;
                }
                if (config_.trims() && config_.is_trim_scalar(c)) {
                    trimmed_after_quote = true;
                    break;
                }
                Match match = match_delimiter(c);
                if (match == Match::FIELD) {
                    finish_field(fields, field, true);
                    state = State::BETWEEN_ROWS;
                } else if (match == Match::ROW) {
                    finish_field(fields, field, true);
                    state = State::ROW_COMPLETE;
                } else {
                    throw CsvException(
                        CsvError(ErrorCode::INVALID_QUOTE_ESCAPE,
                                 "Unexpected character " + format_scalar(c) +
                                     " after closing quote",
                                 "Only a delimiter may follow a closing quote; "
                                 "write quotes inside a field as '\"\"'")
                            .at(rows_read_, fields.size())
                            .with_scalar(c)
                            .with_offset(offset_ - 1));
                }
                break;
            }

            case State::ROW_COMPLETE:
            case State::END_OF_INPUT:
                break;
        }
    }

    if (verbose) {
        trace.log("row %zu: %zu field(s), offset %zu", rows_read_, fields.size(), offset_);
    }
    return fields;
}

const char* CsvReader::state_name(State state) {
    switch (state) {
        case State::BETWEEN_ROWS: return "BETWEEN_ROWS";
        case State::IN_UNQUOTED_FIELD: return "IN_UNQUOTED_FIELD";
        case State::IN_QUOTED_FIELD: return "IN_QUOTED_FIELD";
        case State::AFTER_CLOSING_QUOTE: return "AFTER_CLOSING_QUOTE";
        case State::ROW_COMPLETE: return "ROW_COMPLETE";
        case State::END_OF_INPUT: return "END_OF_INPUT";
    }
    return "UNKNOWN";
}

}  // namespace unicsv
