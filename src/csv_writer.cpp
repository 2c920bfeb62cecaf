#include "csv_writer.h"

#include "debug.h"
#include "utf8.h"

namespace unicsv {

CsvWriter::CsvWriter(OutputSink& sink, const WriterOptions& options) : options_(options) {
    options_.delimiters.validate();
    encoder_ = make_scalar_encoder(sink, options_.encoding, options_.bom);
    if (!options_.headers.empty()) write_row(options_.headers);
}

bool CsvWriter::needs_quoting(std::u32string_view field, const Delimiters& delimiters) {
    for (char32_t c : field) {
        if (c == QUOTE_SCALAR || c == U'\n' || c == U'\r') return true;
        if (delimiters.field.find(c) != std::u32string::npos) return true;
        if (delimiters.row.find(c) != std::u32string::npos) return true;
    }
    return false;
}

void CsvWriter::write_scalars(std::u32string_view field) {
    if (!needs_quoting(field, options_.delimiters)) {
        encoder_->encode(field);
        return;
    }
    encoder_->encode(QUOTE_SCALAR);
    for (char32_t c : field) {
        if (c == QUOTE_SCALAR) encoder_->encode(QUOTE_SCALAR);
        encoder_->encode(c);
    }
    encoder_->encode(QUOTE_SCALAR);
}

void CsvWriter::write_field(std::string_view field) {
    std::u32string scalars = from_utf8(field);
    if (fields_in_row_ > 0) {
        lone_empty_pending_ = false;
        encoder_->encode(options_.delimiters.field);
    }
    // An empty first field is held back: alone in its row it must be quoted
    if (fields_in_row_ == 0 && scalars.empty()) {
        lone_empty_pending_ = true;
    } else {
        write_scalars(scalars);
    }
    ++fields_in_row_;
}

void CsvWriter::end_row() {
    if (lone_empty_pending_ && fields_in_row_ == 1) {
        encoder_->encode(U"\"\"");
    }
    lone_empty_pending_ = false;
    encoder_->encode(options_.delimiters.row);
    fields_in_row_ = 0;
    ++rows_written_;

    auto& trace = debug::global_trace();
    if (trace.verbose()) {
        trace.log("wrote row %zu, %zu byte(s) total", rows_written_ - 1,
                  encoder_->bytes_written());
    }
}

void CsvWriter::write_row(const std::vector<std::string>& fields) {
    for (const auto& field : fields) write_field(field);
    end_row();
}

}  // namespace unicsv
