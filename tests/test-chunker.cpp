#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>
#include "../include/chunker.hpp"
#include "../include/chunk-hasher.hpp"
#include "../include/errors.hpp"
#include "test-helpers.hpp"

// serves the first fail_after bytes of data, then the device fails
class FailingBuffer : public std::streambuf
{
    std::string data;

public:
    FailingBuffer(std::string data, size_t fail_after) : data(std::move(data))
    {
        setg(this->data.data(), this->data.data(), this->data.data() + fail_after);
    }

protected:
    int_type underflow() override
    {
        throw std::runtime_error("device failed");
    }
};

class ChunkerTest : public ::testing::Test
{
protected:
    ChunkerParams params;

    void SetUp() override
    {
        // small chunks so a few hundred KiB give plenty of them
        params.chunk_filter_bits = 12;
        params.min_chunk_size = 1024;
        params.max_chunk_size = 16 * 1024;
        params.hash_window_size = 16;
        params.chunk_hash_length = 32;
    }

    std::vector<Chunk> chunk_all(const std::string &data) const
    {
        std::istringstream source(data);
        Chunker chunker(params, source);

        std::vector<Chunk> chunks;
        while (auto chunk = chunker.next())
            chunks.push_back(std::move(*chunk));

        return chunks;
    }

    std::vector<std::string> checksums(const std::vector<Chunk> &chunks) const
    {
        std::vector<std::string> result;
        for (const auto &chunk : chunks)
            result.push_back(Blake2bHasher::checksum(chunk.data, params.chunk_hash_length));
        return result;
    }
};

TEST_F(ChunkerTest, EmptyInputGivesNoChunks)
{
    EXPECT_TRUE(chunk_all("").empty());
}

TEST_F(ChunkerTest, InputBelowMinSizeIsOneChunk)
{
    const std::string data = random_bytes(params.min_chunk_size - 1, 7);
    const auto chunks = chunk_all(data);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].offset, 0u);
    EXPECT_EQ(chunks[0].data, data);
}

TEST_F(ChunkerTest, ChunksAreContiguousAndWithinBounds)
{
    const std::string data = random_bytes(3 * 1024 * 1024 + 123, 8);
    const auto chunks = chunk_all(data);

    ASSERT_GT(chunks.size(), 1u);

    uint64_t expected_offset = 0;
    std::string rebuilt;

    for (size_t i = 0; i < chunks.size(); i++)
    {
        EXPECT_EQ(chunks[i].offset, expected_offset);
        EXPECT_LE(chunks[i].data.size(), params.max_chunk_size);

        if (i + 1 < chunks.size())
            EXPECT_GE(chunks[i].data.size(), params.min_chunk_size);

        expected_offset += chunks[i].data.size();
        rebuilt += chunks[i].data;
    }

    EXPECT_EQ(expected_offset, data.size());
    EXPECT_EQ(rebuilt, data);
}

TEST_F(ChunkerTest, MaxSizeCutsUniformData)
{
    const std::string data(100 * 1024, 'a');
    const auto chunks = chunk_all(data);

    ASSERT_GT(chunks.size(), 1u);

    // every window holds the same bytes, so all full chunks get cut at the same length
    const uint64_t size = chunks[0].data.size();
    EXPECT_TRUE(size == params.min_chunk_size || size == params.max_chunk_size);

    for (size_t i = 0; i + 1 < chunks.size(); i++)
        EXPECT_EQ(chunks[i].data.size(), size);
}

TEST_F(ChunkerTest, SameInputSameChunks)
{
    const std::string data = random_bytes(512 * 1024, 9);

    EXPECT_EQ(checksums(chunk_all(data)), checksums(chunk_all(data)));
}

TEST_F(ChunkerTest, LocalEditKeepsMostChunks)
{
    const std::string original = random_bytes(1024 * 1024, 10);

    std::string edited = original;
    edited.insert(edited.begin() + 500 * 1024, 'x');

    const auto before = checksums(chunk_all(original));
    const auto after = checksums(chunk_all(edited));

    const std::set<std::string> before_set(before.begin(), before.end());

    size_t shared = 0;
    for (const auto &checksum : after)
        if (before_set.contains(checksum))
            shared++;

    // only the chunks around the insertion change
    EXPECT_GE(shared + 3, before.size());
}

TEST_F(ChunkerTest, InvalidParamsAreRejected)
{
    std::istringstream source("data");

    params.hash_window_size = params.min_chunk_size + 1;
    EXPECT_THROW({ Chunker chunker(params, source); }, ConfigError);

    params.hash_window_size = 16;
    params.min_chunk_size = params.max_chunk_size + 1;
    EXPECT_THROW({ Chunker chunker(params, source); }, ConfigError);
}

TEST_F(ChunkerTest, BytesReadCountsWholeStream)
{
    const std::string data = random_bytes(200 * 1024, 11);
    std::istringstream source(data);
    Chunker chunker(params, source);

    while (chunker.next())
    {
    }

    EXPECT_EQ(chunker.bytes_read(), data.size());
}

TEST_F(ChunkerTest, SourceFailureIsIoError)
{
    const std::string data = random_bytes(4 * 1024 * 1024, 21);
    const size_t fail_after = 2 * 1024 * 1024 + 5;

    FailingBuffer buffer(data, fail_after);
    std::istream source(&buffer);
    Chunker chunker(params, source);

    std::vector<Chunk> chunks;
    EXPECT_THROW(
        {
            while (auto chunk = chunker.next())
                chunks.push_back(std::move(*chunk));
        },
        IoError);

    // chunks handed out before the failure tile the start of the input
    ASSERT_FALSE(chunks.empty());
    uint64_t expected_offset = 0;
    for (const auto &chunk : chunks)
    {
        EXPECT_EQ(chunk.offset, expected_offset);
        EXPECT_EQ(chunk.data, data.substr(chunk.offset, chunk.data.size()));
        expected_offset += chunk.data.size();
    }
    EXPECT_LE(expected_offset, fail_after);
}
