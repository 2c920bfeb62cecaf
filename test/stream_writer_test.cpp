#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <unistd.h>

#include "error.h"
#include "stream_writer.h"
#include "test_helpers.h"

using namespace unicsv;

// ============================================================================
// stream_write retry behaviour
// ============================================================================

class StreamWriteTest : public ::testing::Test {
protected:
    const std::string payload = "hello, world";

    const uint8_t* data() const { return reinterpret_cast<const uint8_t*>(payload.data()); }
};

TEST_F(StreamWriteTest, WritesEverything) {
    MemorySink sink;
    stream_write(sink, data(), payload.size());
    EXPECT_EQ(sink.str(), payload);
}

TEST_F(StreamWriteTest, ContinuesAfterPartialWrites) {
    ScriptedSink sink({3, 4, 1});
    stream_write(sink, data(), payload.size());
    EXPECT_EQ(std::string(sink.bytes().begin(), sink.bytes().end()), payload);
    EXPECT_EQ(sink.calls(), 4);
}

TEST_F(StreamWriteTest, StalledSinkFailsAfterExactlyTwoAttempts) {
    StalledSink sink;
    try {
        stream_write(sink, data(), payload.size());
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::STREAM_EMPTY_WRITE);
        EXPECT_EQ(error_category(e.code()), ErrorCategory::STREAM);
        EXPECT_EQ(e.error().detail("attempts"), "2");
        EXPECT_EQ(e.error().detail("status"), "open");
    }
    EXPECT_EQ(sink.calls(), STREAM_WRITE_ATTEMPTS);
    EXPECT_EQ(sink.calls(), 2);
}

TEST_F(StreamWriteTest, SingleZeroWriteIsRetried) {
    ScriptedSink sink({0, 100});
    stream_write(sink, data(), payload.size());
    EXPECT_EQ(sink.calls(), 2);
    EXPECT_EQ(sink.bytes().size(), payload.size());
}

TEST_F(StreamWriteTest, ProgressResetsTheRetryBudget) {
    ScriptedSink sink({0, 2, 0, 2, 0, 100});
    stream_write(sink, data(), payload.size());
    EXPECT_EQ(sink.bytes().size(), payload.size());
    EXPECT_EQ(sink.calls(), 6);
}

TEST_F(StreamWriteTest, ExplicitErrorFailsImmediately) {
    ScriptedSink sink({5, -1});
    try {
        stream_write(sink, data(), payload.size());
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::STREAM_FAILED);
        EXPECT_EQ(e.error().offset, 5u);
        EXPECT_EQ(e.error().detail("reason"), "scripted failure");
        EXPECT_EQ(e.error().detail("status"), "error");
    }
    EXPECT_EQ(sink.calls(), 2);
}

TEST_F(StreamWriteTest, ClosedSinkFailsBeforeWriting) {
    ScriptedSink sink({}, StreamStatus::CLOSED);
    try {
        stream_write(sink, data(), payload.size());
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::STREAM_NOT_OPEN);
        EXPECT_EQ(e.error().detail("status"), "closed");
    }
    EXPECT_EQ(sink.calls(), 0);
}

TEST_F(StreamWriteTest, ZeroLengthWriteTouchesNothing) {
    ScriptedSink sink;
    stream_write(sink, data(), 0);
    EXPECT_EQ(sink.calls(), 0);
}

// ============================================================================
// Sinks
// ============================================================================

TEST(MemorySinkTest, LimitStallsTheWriter) {
    MemorySink sink(4);
    std::string text = "abcdef";
    EXPECT_THROW(stream_write(sink, reinterpret_cast<const uint8_t*>(text.data()), text.size()),
                 CsvException);
    EXPECT_EQ(sink.str(), "abcd");
}

TEST(MemorySinkTest, ClosedSinkIsNotOpen) {
    MemorySink sink;
    sink.close();
    EXPECT_FALSE(sink.is_open());
    EXPECT_EQ(sink.status(), StreamStatus::CLOSED);
}

TEST(FileSinkTest, WritesFile) {
    char path[] = "/tmp/unicsv_sink_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    ::close(fd);

    {
        FileSink sink;
        EXPECT_EQ(sink.status(), StreamStatus::NOT_OPEN);
        sink.open(path);
        std::string text = "a,b\n";
        stream_write(sink, reinterpret_cast<const uint8_t*>(text.data()), text.size());
        sink.close();
        EXPECT_EQ(sink.status(), StreamStatus::CLOSED);
    }

    std::FILE* fp = std::fopen(path, "rb");
    ASSERT_NE(fp, nullptr);
    char buf[16] = {0};
    size_t n = std::fread(buf, 1, sizeof(buf), fp);
    std::fclose(fp);
    std::remove(path);
    EXPECT_EQ(std::string(buf, n), "a,b\n");
}

TEST(FileSinkTest, UnopenedSinkIsRejected) {
    FileSink sink;
    std::string text = "x";
    try {
        stream_write(sink, reinterpret_cast<const uint8_t*>(text.data()), text.size());
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::STREAM_NOT_OPEN);
        EXPECT_EQ(e.error().detail("status"), "not open");
    }
}

TEST(FileSinkTest, OpenFailureIsIoError) {
    FileSink sink;
    try {
        sink.open("/nonexistent-dir/unicsv/out.csv");
        FAIL() << "Expected CsvException";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::IO_ERROR);
    }
    EXPECT_FALSE(sink.is_open());
}
