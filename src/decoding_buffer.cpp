#include "decoding_buffer.h"

#include "debug.h"
#include "error.h"

namespace unicsv {

const char* buffering_policy_to_string(BufferingPolicy policy) {
    switch (policy) {
        case BufferingPolicy::KEEP_ALL: return "keep-all";
        case BufferingPolicy::SEQUENTIAL: return "sequential";
    }
    return "unknown";
}

DecodingBuffer::DecodingBuffer(CsvReader& reader, BufferingPolicy policy)
    : reader_(reader), policy_(policy) {}

void DecodingBuffer::discard_before(size_t index) {
    size_t dropped = 0;
    while (!rows_.empty() && first_index_ < index) {
        rows_.pop_front();
        ++first_index_;
        ++dropped;
    }
    // Rows never buffered because the parser already moved past them
    if (rows_.empty() && first_index_ < index) first_index_ = index;
    auto& trace = debug::global_trace();
    if (dropped > 0 && trace.verbose()) {
        trace.log("discarded %zu row(s), first available row is now %zu", dropped,
                  first_index_);
    }
}

bool DecodingBuffer::fill_to(size_t index) {
    while (rows_produced() <= index) {
        auto next = reader_.read_row();
        if (!next) return false;
        if (policy_ == BufferingPolicy::SEQUENTIAL) {
            // Only the newest row is kept, so rows passed on the way are dropped
            discard_before(rows_produced());
        }
        rows_.push_back(std::move(*next));
    }
    return true;
}

bool DecodingBuffer::contains(size_t index) {
    if (index < first_index_) return false;
    bool found = fill_to(index);
    if (found && policy_ == BufferingPolicy::SEQUENTIAL) discard_before(index);
    return found;
}

const Row& DecodingBuffer::row(size_t index) {
    if (index < first_index_) {
        throw CsvException(
            CsvError(ErrorCode::BUFFER_FAILURE,
                     "Row " + std::to_string(index) + " was discarded by the " +
                         buffering_policy_to_string(policy_) + " buffering policy",
                     "Use the keep-all buffering policy to revisit earlier rows")
                .at(index, 0)
                .with_detail("first_available", std::to_string(first_index_)));
    }
    if (!fill_to(index)) {
        throw CsvException(
            CsvError(ErrorCode::INVALID_PATH,
                     "Row " + std::to_string(index) + " is past the end of the input (" +
                         std::to_string(rows_produced()) + " row(s))")
                .at(index, 0));
    }
    if (policy_ == BufferingPolicy::SEQUENTIAL) discard_before(index);
    return rows_[index - first_index_];
}

const std::string& DecodingBuffer::field(size_t index, size_t column) {
    const Row& r = row(index);
    if (column >= r.size()) {
        throw CsvException(
            CsvError(ErrorCode::INVALID_PATH,
                     "Column " + std::to_string(column) + " is out of range for row " +
                         std::to_string(index) + " (" + std::to_string(r.size()) + " field(s))")
                .at(index, column));
    }
    return r.fields[column];
}

const std::string& DecodingBuffer::field(size_t index, std::string_view key) {
    auto column = reader_.header_index(key);
    if (!column) {
        throw CsvException(
            CsvError(ErrorCode::INVALID_PATH, "Unknown column '" + std::string(key) + "'",
                     reader_.headers().empty() ? "The input has no header row"
                                               : "Keys are matched against the header row")
                .with_detail("key", std::string(key)));
    }
    return field(index, *column);
}

RowDecoder::RowDecoder(ScalarSource& source, const DecoderConfig& config)
    : config_(config),
      reader_(std::make_unique<CsvReader>(source, config_.reader, config_.detection)),
      buffer_(std::make_unique<DecodingBuffer>(*reader_, config_.buffering)) {
    auto& trace = debug::global_trace();
    if (trace.verbose()) {
        trace.log("decoder: %s buffering", buffering_policy_to_string(config_.buffering));
    }
}

}  // namespace unicsv
