#include <gtest/gtest.h>
#include "../include/chunk-store.hpp"
#include "../include/chunk-codec.hpp"
#include "../include/chunk-hasher.hpp"
#include "../include/errors.hpp"
#include "../include/file-io.hpp"
#include "../include/utils.hpp"
#include "test-helpers.hpp"

class ChunkStoreTest : public TempDirTest
{
protected:
    static ChunkDescriptor describe(const std::string &data, const ChunkPlacement &placement, const std::optional<Compression> &compression = std::nullopt)
    {
        ChunkDescriptor descriptor;
        descriptor.checksum = Blake2bHasher::checksum(data, 32);
        descriptor.source_size = data.size();
        descriptor.source_offsets = {0};
        descriptor.archive_offset = placement.archive_offset;
        descriptor.archive_size = placement.archive_size;
        descriptor.compression = compression;
        return descriptor;
    }
};

TEST_F(ChunkStoreTest, BlobStoreAppendsChunks)
{
    const fs::path path = temp_dir / "blob";
    const std::string a = random_bytes(1000, 1);
    const std::string b = random_bytes(500, 2);

    ChunkPlacement placement_a;
    ChunkPlacement placement_b;
    {
        ExternalChunkStore store(path, BlobChunkStore::Mode::WRITE);
        placement_a = store.put(Blake2bHasher::checksum(a, 32), a);
        placement_b = store.put(Blake2bHasher::checksum(b, 32), b);
        store.flush();

        EXPECT_EQ(store.bytes_written(), 1500u);
    }

    EXPECT_EQ(placement_a.archive_offset, 0u);
    EXPECT_EQ(placement_b.archive_offset, 1000u);
    EXPECT_EQ(placement_b.archive_size, 500u);

    ExternalChunkStore store(path, BlobChunkStore::Mode::READ);
    EXPECT_EQ(store.get(describe(b, placement_b)), b);
    EXPECT_EQ(store.get(describe(a, placement_a)), a);
}

TEST_F(ChunkStoreTest, EmbeddedStoreReadsAfterBaseOffset)
{
    const fs::path path = temp_dir / "archive";
    const std::string header = "HEADER--";
    const std::string chunk = random_bytes(300, 3);

    write_file(path, header + chunk);

    EmbeddedChunkStore store(path, BlobChunkStore::Mode::READ, header.size());
    EXPECT_EQ(store.get(describe(chunk, ChunkPlacement{0, chunk.size()})), chunk);
}

TEST_F(ChunkStoreTest, ShortBlobIsNotFound)
{
    const fs::path path = temp_dir / "blob";
    write_file(path, std::string(100, 'x'));

    ExternalChunkStore store(path, BlobChunkStore::Mode::READ);
    EXPECT_THROW(store.fetch(describe(std::string(50, 'x'), ChunkPlacement{80, 50})), StoreNotFoundError);
}

TEST_F(ChunkStoreTest, OversizedRangeIsNotFound)
{
    const fs::path path = temp_dir / "blob";
    write_file(path, std::string(100, 'x'));

    ExternalChunkStore store(path, BlobChunkStore::Mode::READ);

    // a size far past the file must not be allocated
    EXPECT_THROW(store.fetch(describe("x", ChunkPlacement{0, uint64_t{1} << 62})), StoreNotFoundError);
    EXPECT_THROW(store.fetch(describe("x", ChunkPlacement{uint64_t{1} << 62, 10})), StoreNotFoundError);
}

TEST_F(ChunkStoreTest, WriteToReadOnlyFileIsIoError)
{
    const fs::path path = temp_dir / "blob";
    write_file(path, std::string(100, 'x'));

    FileIO file(path.string(), std::ios::in);
    EXPECT_THROW(file.write_file_at_offset(10, "data"), IoError);
    EXPECT_THROW(file.append_chunk("data"), IoError);
    EXPECT_EQ(read_file(path), std::string(100, 'x'));
}

TEST_F(ChunkStoreTest, MissingBlobIsNotFound)
{
    EXPECT_THROW(ExternalChunkStore(temp_dir / "nope", BlobChunkStore::Mode::READ), StoreNotFoundError);
}

TEST_F(ChunkStoreTest, PerChunkStoreNamesFilesByChecksum)
{
    const fs::path dir = temp_dir / "chunks";
    const std::string data(4096, 'k');
    const EncodedChunk encoded = encode_chunk(data, Compression{});
    const std::string checksum = Blake2bHasher::checksum(data, 32);

    PerChunkStore store(dir, true);
    const ChunkPlacement placement = store.put(checksum, encoded.data);

    EXPECT_EQ(placement.archive_offset, 0u);
    EXPECT_EQ(placement.archive_size, 0u);

    const fs::path expected = dir / (to_hex(checksum) + ".chunk");
    EXPECT_EQ(store.chunk_path(checksum), expected);
    EXPECT_TRUE(fs::exists(expected));
    EXPECT_FALSE(fs::exists(expected.string() + ".incoming"));

    EXPECT_EQ(store.get(describe(data, placement, encoded.compression)), data);
}

TEST_F(ChunkStoreTest, PerChunkStoreMissingChunkIsNotFound)
{
    PerChunkStore store(temp_dir, false);

    EXPECT_THROW(store.fetch(describe("absent", ChunkPlacement{})), StoreNotFoundError);
    EXPECT_THROW(PerChunkStore(temp_dir / "missing"), StoreNotFoundError);
}

TEST_F(ChunkStoreTest, OpenResolvesPathsNextToArchive)
{
    const fs::path archive = temp_dir / "archive.cvlt";
    const std::string chunk = random_bytes(64, 4);
    write_file(temp_dir / "data.chunks", chunk);

    auto store = open_chunk_store(ExternalLocation{"data.chunks"}, archive, 0);
    EXPECT_EQ(store->get(describe(chunk, ChunkPlacement{0, chunk.size()})), chunk);

    // a relocated store wins over the recorded path
    fs::create_directories(temp_dir / "moved");
    write_file(temp_dir / "moved" / "other.chunks", chunk);

    auto moved = open_chunk_store(ExternalLocation{"data.chunks"}, archive, 0, (temp_dir / "moved" / "other.chunks").string());
    EXPECT_EQ(moved->get(describe(chunk, ChunkPlacement{0, chunk.size()})), chunk);

    EXPECT_THROW(open_chunk_store(EmbeddedLocation{}, archive, 0, std::string("elsewhere")), ConfigError);
}
