#include <gtest/gtest.h>
#include "../include/archive.hpp"
#include "../include/chunk-hasher.hpp"
#include "../include/errors.hpp"
#include "test-helpers.hpp"

class ArchiveTest : public TempDirTest
{
protected:
    ChunkDictionary dictionary;

    void SetUp() override
    {
        TempDirTest::SetUp();

        const std::string chunk = "0123456789";

        ChunkDescriptor descriptor;
        descriptor.checksum = Blake2bHasher::checksum(chunk, 64);
        descriptor.source_size = chunk.size();
        descriptor.source_offsets = {0, 10};
        descriptor.archive_size = chunk.size();

        dictionary.application_version = "0.4.0";
        dictionary.source_checksum = Blake2bHasher::checksum(chunk + chunk, 64);
        dictionary.source_total_size = 20;
        dictionary.chunker_params = ChunkerParams{};
        dictionary.chunk_descriptors = {descriptor};
    }
};

TEST_F(ArchiveTest, HeaderRoundTrip)
{
    const fs::path scratch = temp_dir / "scratch";
    const fs::path archive = temp_dir / "out.cvlt";
    write_file(scratch, "0123456789");

    write_archive(archive, dictionary, scratch);

    const ArchiveHeader header = read_archive_header(archive);
    EXPECT_EQ(header.dictionary.source_checksum, dictionary.source_checksum);
    EXPECT_EQ(header.dictionary.chunk_descriptors, dictionary.chunk_descriptors);
    EXPECT_EQ(header.chunk_data_offset, build_archive_header(dictionary).size());

    // chunk data follows the header
    const std::string content = read_file(archive);
    EXPECT_EQ(content.substr(header.chunk_data_offset), "0123456789");
    EXPECT_EQ(content.substr(0, sizeof(ARCHIVE_MAGIC)), std::string(ARCHIVE_MAGIC, sizeof(ARCHIVE_MAGIC)));
}

TEST_F(ArchiveTest, ExternalArchiveHoldsOnlyHeader)
{
    const fs::path archive = temp_dir / "out.cvlt";
    dictionary.chunk_data_location = ExternalLocation{"out.chunks"};

    write_archive(archive, dictionary, std::nullopt);

    const ArchiveHeader header = read_archive_header(archive);
    EXPECT_EQ(fs::file_size(archive), header.chunk_data_offset);
    EXPECT_EQ(header.dictionary.chunk_data_location, ChunkLocation(ExternalLocation{"out.chunks"}));
}

TEST_F(ArchiveTest, CorruptHeaderIsRejected)
{
    const fs::path archive = temp_dir / "out.cvlt";
    write_archive(archive, dictionary, std::nullopt);

    std::string content = read_file(archive);
    content[sizeof(ARCHIVE_MAGIC) + sizeof(uint64_t) + 3] ^= 0x01;
    write_file(archive, content);

    EXPECT_THROW(read_archive_header(archive), DictionaryInvalidError);
}

TEST_F(ArchiveTest, WrongMagicIsRejected)
{
    const fs::path archive = temp_dir / "not-an-archive";
    write_file(archive, "definitely not a chunkvault archive");

    EXPECT_THROW(read_archive_header(archive), DictionaryInvalidError);
}

TEST_F(ArchiveTest, TruncatedHeaderIsRejected)
{
    const fs::path archive = temp_dir / "out.cvlt";
    write_archive(archive, dictionary, std::nullopt);

    const std::string content = read_file(archive);
    write_file(archive, content.substr(0, content.size() - 10));

    EXPECT_THROW(read_archive_header(archive), DictionaryInvalidError);
}
