#include "stream_writer.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "error.h"

namespace unicsv {

const char* stream_status_to_string(StreamStatus status) {
    switch (status) {
        case StreamStatus::NOT_OPEN: return "not open";
        case StreamStatus::OPEN: return "open";
        case StreamStatus::AT_END: return "at end";
        case StreamStatus::CLOSED: return "closed";
        case StreamStatus::ERROR: return "error";
    }
    return "unknown";
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(int fd) : fd_(fd), owns_fd_(false) {
    status_ = fd >= 0 ? StreamStatus::OPEN : StreamStatus::NOT_OPEN;
}

FileSink::~FileSink() {
    if (owns_fd_ && fd_ >= 0) ::close(fd_);
}

void FileSink::open(const std::string& path) {
    close();
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        error_ = std::strerror(errno);
        status_ = StreamStatus::ERROR;
        throw CsvException(CsvError(ErrorCode::IO_ERROR, "Cannot open '" + path + "' for writing")
                               .with_detail("errno", error_));
    }
    owns_fd_ = true;
    status_ = StreamStatus::OPEN;
}

void FileSink::close() {
    if (owns_fd_ && fd_ >= 0) ::close(fd_);
    if (fd_ >= 0) status_ = StreamStatus::CLOSED;
    fd_ = -1;
    owns_fd_ = false;
}

ptrdiff_t FileSink::write(const uint8_t* data, size_t len) {
    ssize_t n = ::write(fd_, data, len);
    if (n >= 0) return n;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
    error_ = std::strerror(errno);
    status_ = StreamStatus::ERROR;
    return -1;
}

// ============================================================================
// MemorySink
// ============================================================================

ptrdiff_t MemorySink::write(const uint8_t* data, size_t len) {
    size_t accepted = len;
    if (limit_) {
        size_t room = *limit_ > bytes_.size() ? *limit_ - bytes_.size() : 0;
        accepted = std::min(len, room);
    }
    bytes_.insert(bytes_.end(), data, data + accepted);
    return static_cast<ptrdiff_t>(accepted);
}

// ============================================================================
// stream_write
// ============================================================================

void stream_write(OutputSink& sink, const uint8_t* data, size_t len) {
    if (!sink.is_open()) {
        throw CsvException(CsvError(ErrorCode::STREAM_NOT_OPEN, "Output stream is not open",
                                    "Open the sink before writing")
                               .with_detail("status", stream_status_to_string(sink.status())));
    }

    size_t written = 0;
    int attempts = 0;
    while (written < len) {
        ptrdiff_t n = sink.write(data + written, len - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            attempts = 0;
            continue;
        }
        if (n < 0) {
            CsvError error(ErrorCode::STREAM_FAILED, "Output stream reported an error");
            error.with_offset(written)
                .with_detail("status", stream_status_to_string(sink.status()))
                .with_detail("bytes_remaining", std::to_string(len - written));
            std::string reason = sink.error_message();
            if (!reason.empty()) error.with_detail("reason", reason);
            throw CsvException(error);
        }
        if (++attempts >= STREAM_WRITE_ATTEMPTS) {
            throw CsvException(
                CsvError(ErrorCode::STREAM_EMPTY_WRITE,
                         "Output stream accepted no bytes after " + std::to_string(attempts) +
                             " attempts",
                         "The sink may be full or blocked")
                    .with_offset(written)
                    .with_detail("attempts", std::to_string(attempts))
                    .with_detail("status", stream_status_to_string(sink.status()))
                    .with_detail("bytes_remaining", std::to_string(len - written)));
        }
    }
}

}  // namespace unicsv
