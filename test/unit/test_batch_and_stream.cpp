// Parallel batches and chunked streaming.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "redaction/parallel_batch_redactor.hpp"
#include "redaction/redactor.hpp"
#include "redaction/stream_redactor.hpp"

using phiscrub::redaction::ParallelBatchRedactor;
using phiscrub::redaction::Redactor;
using phiscrub::redaction::StreamChunk;
using phiscrub::redaction::StreamRedactor;

namespace {

std::vector<std::string> mixedBatch(size_t count) {
    const std::vector<std::string> seeds = {
        "Call me at 555-123-4567",
        "Contact: jane.doe@example.com",
        "SSN: 123-45-6789",
        "John Smith, DOB 04/12/1980, MRN: AB12345",
        "The weather is lovely today.",
        "",
    };
    std::vector<std::string> out;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(seeds[i % seeds.size()] + (i % 2 ? " #" + std::to_string(i) : ""));
    }
    return out;
}

TEST(ParallelBatchRedactorTest, MatchesSequentialBatch) {
    Redactor redactor;
    ParallelBatchRedactor parallel(redactor, 4, 1);
    EXPECT_EQ(parallel.threadCount(), 4u);

    std::vector<std::string> items = mixedBatch(100);
    std::vector<std::string> expected = redactor.batchRedact(items);
    EXPECT_EQ(parallel.batchRedact(items), expected);
}

TEST(ParallelBatchRedactorTest, SmallBatchRunsInline) {
    Redactor redactor;
    ParallelBatchRedactor parallel(redactor, 2);

    std::vector<std::string> items = {"SSN: 123-45-6789", "hi"};
    std::vector<std::string> out = parallel.batchRedact(items);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "SSN: [REDACTED_SSN]");
    EXPECT_EQ(out[1], "hi");
    EXPECT_TRUE(parallel.batchRedact({}).empty());
}

TEST(StreamRedactorTest, RejectsZeroChunkSize) {
    Redactor redactor;
    EXPECT_THROW(StreamRedactor(redactor, 0), std::invalid_argument);
}

TEST(StreamRedactorTest, EmptyTextEmitsNothing) {
    Redactor redactor;
    StreamRedactor stream(redactor);
    EXPECT_EQ(stream.chunkSize(), StreamRedactor::kDefaultChunkSize);
    EXPECT_TRUE(stream.redactStreaming("").empty());
}

TEST(StreamRedactorTest, ChunkCountAndProgress) {
    Redactor redactor;
    StreamRedactor stream(redactor, 500);

    std::string text(1200, 'a');
    std::vector<StreamChunk> chunks = stream.redactStreaming(text);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].chunk.size(), 500u);
    EXPECT_EQ(chunks[2].chunk.size(), 200u);
    EXPECT_DOUBLE_EQ(chunks[0].progress, 500.0 / 1200.0);
    EXPECT_DOUBLE_EQ(chunks.back().progress, 1.0);
    for (size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_GT(chunks[i].progress, chunks[i - 1].progress);
    }
}

TEST(StreamRedactorTest, ChunksAreRedacted) {
    Redactor redactor;
    StreamRedactor stream(redactor, 500);

    std::string joined;
    size_t count = stream.redactStreaming("SSN: 123-45-6789", [&joined](const StreamChunk& c) {
        joined += c.chunk;
    });
    EXPECT_EQ(count, 1u);
    EXPECT_EQ(joined, "SSN: [REDACTED_SSN]");
}

TEST(StreamRedactorTest, NeverSplitsMultiByteCharacters) {
    Redactor redactor;
    StreamRedactor stream(redactor, 3);

    std::string text;
    for (int i = 0; i < 5; ++i) {
        text += "\xC3\xA9";  // U+00E9
    }
    std::vector<StreamChunk> chunks = stream.redactStreaming(text);
    ASSERT_EQ(chunks.size(), 5u);

    std::string joined;
    for (const auto& c : chunks) {
        EXPECT_EQ(c.chunk, "\xC3\xA9");
        joined += c.chunk;
    }
    EXPECT_EQ(joined, text);
}

} // anonymous namespace
