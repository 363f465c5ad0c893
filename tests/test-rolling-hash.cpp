#include <gtest/gtest.h>
#include <stdexcept>
#include "../include/rolling-hash.hpp"
#include "../include/chunk-boundary-detector.hpp"
#include "../include/errors.hpp"
#include "test-helpers.hpp"

TEST(BuzHashTest, ZeroWindowIsRejected)
{
    EXPECT_THROW(BuzHash(0), std::invalid_argument);
}

TEST(BuzHashTest, ValidOnceWindowIsFull)
{
    BuzHash hash(4);

    hash.push(1);
    hash.push(2);
    hash.push(3);
    EXPECT_FALSE(hash.valid());

    hash.push(4);
    EXPECT_TRUE(hash.valid());

    hash.reset();
    EXPECT_FALSE(hash.valid());
    EXPECT_EQ(hash.current_hash(), 0u);
}

TEST(BuzHashTest, HashDependsOnlyOnWindowContents)
{
    const std::string prefix_a = random_bytes(1000, 1);
    const std::string prefix_b = random_bytes(37, 2);
    const std::string window = random_bytes(16, 3);

    BuzHash a(16);
    BuzHash b(16);

    for (const char c : prefix_a)
        a.push(static_cast<uint8_t>(c));
    for (const char c : prefix_b)
        b.push(static_cast<uint8_t>(c));

    for (const char c : window)
    {
        a.push(static_cast<uint8_t>(c));
        b.push(static_cast<uint8_t>(c));
    }

    EXPECT_EQ(a.current_hash(), b.current_hash());
}

TEST(BuzHashTest, SameSeedSameHash)
{
    const std::string data = random_bytes(4096, 4);

    BuzHash a(32);
    BuzHash b(32);
    BuzHash other_seed(32, 12345);

    for (const char c : data)
    {
        a.push(static_cast<uint8_t>(c));
        b.push(static_cast<uint8_t>(c));
        other_seed.push(static_cast<uint8_t>(c));
    }

    EXPECT_EQ(a.current_hash(), b.current_hash());
    EXPECT_NE(a.current_hash(), other_seed.current_hash());
}

TEST(ChunkBoundaryDetectorTest, ForcesBoundaryAtMaxSize)
{
    ChunkerParams params;
    params.chunk_filter_bits = 32;
    params.min_chunk_size = 8;
    params.max_chunk_size = 100;
    params.hash_window_size = 4;

    ChunkBoundaryDetector detector(params);
    const std::string data(250, '\0');

    std::vector<uint64_t> boundaries;
    for (size_t i = 0; i < data.size(); i++)
        if (detector.push(static_cast<uint8_t>(data[i])))
            boundaries.push_back(i + 1);

    // a run of zeros never matches an all ones mask
    EXPECT_EQ(boundaries, (std::vector<uint64_t>{100, 200}));
    EXPECT_EQ(detector.accumulated(), 50u);
    EXPECT_EQ(detector.state(), ChunkBoundaryDetector::State::ACCUMULATING);
}

TEST(ChunkBoundaryDetectorTest, NoBoundaryBeforeMinSize)
{
    ChunkerParams params;
    params.chunk_filter_bits = 0;
    params.min_chunk_size = 10;
    params.max_chunk_size = 1000;
    params.hash_window_size = 4;

    // with no filter bits every testable position is a boundary
    ChunkBoundaryDetector detector(params);

    for (int i = 0; i < 9; i++)
        EXPECT_FALSE(detector.push(static_cast<uint8_t>(i)));

    EXPECT_TRUE(detector.push(9));
    EXPECT_EQ(detector.state(), ChunkBoundaryDetector::State::BOUNDARY_EMITTED);

    // the next byte starts a new chunk
    EXPECT_FALSE(detector.push(10));
    EXPECT_EQ(detector.accumulated(), 1u);
}

TEST(ChunkBoundaryDetectorTest, FilterBitsAbove32AreRejected)
{
    ChunkerParams params;
    params.chunk_filter_bits = 33;
    params.min_chunk_size = 8;
    params.max_chunk_size = 100;
    params.hash_window_size = 4;

    EXPECT_THROW({ ChunkBoundaryDetector detector(params); }, ConfigError);

    params.chunk_filter_bits = 32;
    EXPECT_EQ(params.filter_mask(), 0xFFFFFFFFu);
}
