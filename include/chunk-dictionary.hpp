#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "chunker-params.hpp"

using json = nlohmann::json;

enum class CompressionType
{
    LZMA
};

struct Compression
{
    CompressionType type = CompressionType::LZMA;
    uint32_t level = 6;

    bool operator==(const Compression &) const = default;
};

// metadata of one unique chunk
struct ChunkDescriptor
{
    // content hash truncated to chunk_hash_length
    std::string checksum;

    // stored raw when not set
    std::optional<Compression> compression;

    // byte range of the stored chunk, zero for per chunk storage
    uint64_t archive_size = 0;
    uint64_t archive_offset = 0;

    uint64_t source_size = 0;

    // ascending, more than one entry means the chunk was deduplicated
    std::vector<uint64_t> source_offsets;

    bool operator==(const ChunkDescriptor &) const = default;
};

// chunk data lives in the archive itself, after the header
struct EmbeddedLocation
{
    bool operator==(const EmbeddedLocation &) const = default;
};

// all chunks back to back in one external file
struct ExternalLocation
{
    std::string path;
    bool operator==(const ExternalLocation &) const = default;
};

// one file per chunk named by the hex checksum
struct PerChunkLocation
{
    std::string dir;
    bool operator==(const PerChunkLocation &) const = default;
};

using ChunkLocation = std::variant<EmbeddedLocation, ExternalLocation, PerChunkLocation>;

struct ChunkDictionary
{
    // only used for diagnostics
    std::string application_version;
    std::string source_checksum;
    uint64_t source_total_size = 0;
    ChunkLocation chunk_data_location;
    std::optional<ChunkerParams> chunker_params;

    // in order of first occurrence in the source
    std::vector<ChunkDescriptor> chunk_descriptors;
};

// throws DictionaryInvalidError unless the descriptors exactly tile the source
void validate_dictionary(const ChunkDictionary &dictionary);

// protobuf wire representation
std::string serialize_dictionary(const ChunkDictionary &dictionary);
ChunkDictionary parse_dictionary(std::string_view data);

std::string location_to_string(const ChunkLocation &location);

json dictionary_to_json(const ChunkDictionary &dictionary);
