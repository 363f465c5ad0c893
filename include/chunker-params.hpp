#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// size of a BLAKE2b-512 digest
constexpr uint32_t MAX_CHUNK_HASH_LENGTH = 64;

// immutable chunking configuration recorded in every dictionary
struct ChunkerParams
{
    // average chunk size is 2^chunk_filter_bits
    uint32_t chunk_filter_bits = 16;
    uint64_t min_chunk_size = 16 * 1024;
    uint64_t max_chunk_size = 16 * 1024 * 1024;
    uint32_t hash_window_size = 16;
    uint32_t chunk_hash_length = MAX_CHUNK_HASH_LENGTH;

    // throws ConfigError when the parameters can't produce a valid chunking
    void validate() const;

    uint32_t filter_mask() const;

    bool operator==(const ChunkerParams &) const = default;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ChunkerParams, chunk_filter_bits, min_chunk_size, max_chunk_size, hash_window_size, chunk_hash_length);
};
