#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "chunk-dictionary.hpp"
#include "file-io.hpp"

namespace fs = std::filesystem;

/*
    archive layout:
    [8 bytes magic][u64 dictionary size][dictionary][u64 chunk data offset][64 bytes header checksum][chunk data]
    numbers are big endian, the checksum is BLAKE2b-512 over every header byte before it
*/
constexpr char ARCHIVE_MAGIC[8] = {'C', 'V', 'A', 'U', 'L', 'T', '\0', '\x01'};
constexpr size_t HEADER_CHECKSUM_LENGTH = 64;

struct ArchiveHeader
{
    ChunkDictionary dictionary;

    // absolute offset of the embedded chunk data
    uint64_t chunk_data_offset = 0;
};

std::string build_archive_header(const ChunkDictionary &dictionary);

// throws DictionaryInvalidError when the file is not an archive or the header is corrupt
ArchiveHeader read_archive_header(FileIO &archive);
ArchiveHeader read_archive_header(const fs::path &archive_path);

// writes the header followed by the chunk data of the scratch file, if any
void write_archive(const fs::path &output_path, const ChunkDictionary &dictionary, const std::optional<fs::path> &embedded_chunk_file);
