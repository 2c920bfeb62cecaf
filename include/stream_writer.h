/**
 * @file stream_writer.h
 * @brief Byte sinks and the bounded-retry writer in front of them.
 */

#ifndef UNICSV_STREAM_WRITER_H
#define UNICSV_STREAM_WRITER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace unicsv {

/// Lifecycle of an output sink
enum class StreamStatus {
    NOT_OPEN,
    OPEN,
    AT_END,
    CLOSED,
    ERROR
};

const char* stream_status_to_string(StreamStatus status);

/**
 * @brief Writable byte destination.
 *
 * write() reports a positive count for bytes accepted, zero when the sink made
 * no progress without failing, and a negative value for an explicit error
 * (error_message() then describes it).
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual StreamStatus status() const = 0;
    virtual ptrdiff_t write(const uint8_t* data, size_t len) = 0;
    virtual std::string error_message() const { return {}; }

    bool is_open() const { return status() == StreamStatus::OPEN; }
};

/**
 * @brief Sink over a POSIX file descriptor.
 *
 * EAGAIN and EINTR are reported as zero progress. The descriptor is closed
 * by close() or the destructor when the sink opened it.
 */
class FileSink : public OutputSink {
public:
    FileSink() = default;

    /// Wrap an existing descriptor (e.g. STDOUT_FILENO); it is not closed
    explicit FileSink(int fd);

    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    /// Create or truncate `path`; throws CsvException(IO_ERROR) on failure
    void open(const std::string& path);
    void close();

    StreamStatus status() const override { return status_; }
    ptrdiff_t write(const uint8_t* data, size_t len) override;
    std::string error_message() const override { return error_; }

private:
    int fd_ = -1;
    bool owns_fd_ = false;
    StreamStatus status_ = StreamStatus::NOT_OPEN;
    std::string error_;
};

/**
 * @brief Growable in-memory sink.
 *
 * With a limit set, bytes beyond it are refused with zero progress, which
 * is how a full device looks to the writer.
 */
class MemorySink : public OutputSink {
public:
    explicit MemorySink(std::optional<size_t> limit = std::nullopt) : limit_(limit) {}

    StreamStatus status() const override { return status_; }
    ptrdiff_t write(const uint8_t* data, size_t len) override;

    void close() { status_ = StreamStatus::CLOSED; }

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::string str() const { return std::string(bytes_.begin(), bytes_.end()); }

private:
    std::optional<size_t> limit_;
    StreamStatus status_ = StreamStatus::OPEN;
    std::vector<uint8_t> bytes_;
};

/// Consecutive zero-progress attempts before a write gives up
constexpr int STREAM_WRITE_ATTEMPTS = 2;

/**
 * @brief Write exactly `len` bytes, in order.
 *
 * A zero-byte write is retried until STREAM_WRITE_ATTEMPTS consecutive
 * attempts made no progress; any progress resets the count.
 *
 * @throws CsvException STREAM_NOT_OPEN before anything is attempted when the
 *         sink is not open, STREAM_FAILED when the sink reports an error,
 *         STREAM_EMPTY_WRITE when the retry budget runs out
 */
void stream_write(OutputSink& sink, const uint8_t* data, size_t len);

}  // namespace unicsv

#endif  // UNICSV_STREAM_WRITER_H
