#include <format>
#include "../include/chunker-params.hpp"
#include "../include/errors.hpp"

void ChunkerParams::validate() const
{
    if (chunk_filter_bits > 32)
        throw ConfigError(std::format("chunk filter bits must be at most 32, got {}", chunk_filter_bits));

    if (max_chunk_size == 0)
        throw ConfigError("max chunk size must be greater than zero");

    if (min_chunk_size > max_chunk_size)
        throw ConfigError(std::format("min chunk size {} exceeds max chunk size {}", min_chunk_size, max_chunk_size));

    if (hash_window_size == 0)
        throw ConfigError("hash window size must be greater than zero");

    // the window has to fit inside the smallest chunk
    if (hash_window_size > min_chunk_size)
        throw ConfigError(std::format("hash window size {} exceeds min chunk size {}", hash_window_size, min_chunk_size));

    if (chunk_hash_length == 0 || chunk_hash_length > MAX_CHUNK_HASH_LENGTH)
        throw ConfigError(std::format("chunk hash length must be within 1-{}, got {}", MAX_CHUNK_HASH_LENGTH, chunk_hash_length));
}

uint32_t ChunkerParams::filter_mask() const
{
    if (chunk_filter_bits == 0)
        return 0;

    if (chunk_filter_bits >= 32)
        return ~uint32_t{0};

    return ~uint32_t{0} >> (32 - chunk_filter_bits);
}
