#include <gtest/gtest.h>

#include <deque>
#include <random>
#include <string>

#include "scalar_buffer.h"
#include "scalar_source.h"

using namespace unicsv;

// ============================================================================
// ScalarBuffer ordering
// ============================================================================

class ScalarBufferTest : public ::testing::Test {
protected:
    static std::u32string drain(ScalarBuffer& buffer) {
        std::u32string out;
        while (auto c = buffer.next()) out.push_back(*c);
        return out;
    }

    ScalarBuffer buffer;
};

TEST_F(ScalarBufferTest, EmptyBufferReturnsNullopt) {
    EXPECT_TRUE(buffer.empty());
    EXPECT_FALSE(buffer.next().has_value());
}

TEST_F(ScalarBufferTest, AppendIsFifo) {
    buffer.append(U'a');
    buffer.append(U"bc");
    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(drain(buffer), U"abc");
}

TEST_F(ScalarBufferTest, PrependKeepsRelativeOrder) {
    buffer.append(U"xyz");
    buffer.prepend(U"abc");
    EXPECT_EQ(drain(buffer), U"abcxyz") << "Prepended batch must come out in its own order";
}

TEST_F(ScalarBufferTest, SinglePrependGoesFirst) {
    buffer.append(U"bc");
    buffer.prepend(U'a');
    EXPECT_EQ(drain(buffer), U"abc");
}

TEST_F(ScalarBufferTest, InterleavedOperations) {
    buffer.append(U"de");
    buffer.prepend(U"bc");
    EXPECT_EQ(*buffer.next(), U'b');
    buffer.prepend(U'a');
    buffer.append(U"f");
    EXPECT_EQ(drain(buffer), U"acdef");
}

TEST_F(ScalarBufferTest, ClearEmptiesBuffer) {
    buffer.append(U"abc");
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_FALSE(buffer.next().has_value());
}

// Random operation sequences against a std::deque model
TEST_F(ScalarBufferTest, MatchesQueueModel) {
    std::mt19937 rng(1234);
    std::deque<char32_t> model;
    char32_t counter = 0x100;

    for (int step = 0; step < 2000; ++step) {
        int op = static_cast<int>(rng() % 3);
        size_t count = 1 + rng() % 4;
        std::u32string batch;
        for (size_t i = 0; i < count; ++i) batch.push_back(counter++);

        if (op == 0) {
            buffer.prepend(batch);
            model.insert(model.begin(), batch.begin(), batch.end());
        } else if (op == 1) {
            buffer.append(batch);
            model.insert(model.end(), batch.begin(), batch.end());
        } else {
            auto got = buffer.next();
            if (model.empty()) {
                ASSERT_FALSE(got.has_value());
            } else {
                ASSERT_TRUE(got.has_value());
                ASSERT_EQ(*got, model.front()) << "Mismatch at step " << step;
                model.pop_front();
            }
        }
        ASSERT_EQ(buffer.size(), model.size());
    }
}

// ============================================================================
// Lookahead restore
// ============================================================================

TEST(LookaheadTest, RestoresSourceScalars) {
    U32StringSource source(U"abcdef");
    ScalarBuffer buffer;
    {
        Lookahead lookahead(source, buffer);
        auto [sample, ended] = lookahead.read_sample(3);
        EXPECT_EQ(sample, U"abc");
        EXPECT_FALSE(ended);
    }
    std::u32string seen;
    while (auto c = next_scalar(source, buffer)) seen.push_back(*c);
    EXPECT_EQ(seen, U"abcdef") << "Everything read ahead must be seen again";
}

TEST(LookaheadTest, RestoresBufferedThenSourceScalars) {
    U32StringSource source(U"cdef");
    ScalarBuffer buffer;
    buffer.append(U"ab");
    {
        Lookahead lookahead(source, buffer);
        auto [sample, ended] = lookahead.read_sample(100);
        EXPECT_EQ(sample, U"abcdef");
        EXPECT_TRUE(ended);
    }
    std::u32string seen;
    while (auto c = next_scalar(source, buffer)) seen.push_back(*c);
    EXPECT_EQ(seen, U"abcdef");
}

TEST(LookaheadTest, SampleEndingExactlyAtLimitIsComplete) {
    U32StringSource source(U"abc");
    ScalarBuffer buffer;
    Lookahead lookahead(source, buffer);
    auto [sample, ended] = lookahead.read_sample(3);
    EXPECT_EQ(sample, U"abc");
    EXPECT_TRUE(ended);
}

TEST(LookaheadTest, RestoresDuringUnwinding) {
    U32StringSource source(U"xyz");
    ScalarBuffer buffer;
    try {
        Lookahead lookahead(source, buffer);
        lookahead.next();
        lookahead.next();
        throw std::runtime_error("inference failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(buffer.size(), 2u);
    EXPECT_EQ(*next_scalar(source, buffer), U'x');
}
