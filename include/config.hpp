#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "chunk-dictionary.hpp"
#include "chunker-params.hpp"

using json = nlohmann::json;

#define DEFAULT_AVG_CHUNK_SIZE (64 * 1024)
#define DEFAULT_MIN_CHUNK_SIZE (16 * 1024)
#define DEFAULT_MAX_CHUNK_SIZE (16 * 1024 * 1024)
#define DEFAULT_HASH_WINDOW_SIZE 16
#define DEFAULT_COMPRESSION_LEVEL 6

struct PackConfig
{
    bool force_create = false;

    // stdin when not set
    std::optional<std::string> input;
    std::string output;

    uint64_t avg_chunk_size = DEFAULT_AVG_CHUNK_SIZE;
    uint64_t min_chunk_size = DEFAULT_MIN_CHUNK_SIZE;
    uint64_t max_chunk_size = DEFAULT_MAX_CHUNK_SIZE;
    uint32_t hash_window_size = DEFAULT_HASH_WINDOW_SIZE;
    uint32_t chunk_hash_length = MAX_CHUNK_HASH_LENGTH;

    // LZMA or NONE
    std::string compression = "LZMA";
    uint32_t compression_level = DEFAULT_COMPRESSION_LEVEL;

    // at most one of them, chunk data is embedded otherwise
    std::optional<std::string> chunk_file;
    std::optional<std::string> chunk_dir;

    size_t threads = 0;
    bool verbose = false;
    bool progress = true;

    // throws ConfigError on inconsistent options
    void validate() const;
    ChunkerParams chunker_params() const;
    std::optional<Compression> chunk_compression() const;
    ChunkLocation chunk_location() const;
};

struct UnpackConfig
{
    bool force_create = false;
    std::string input;
    std::string output;
    std::vector<std::string> seed_files;

    // relocated external chunk file or chunk directory
    std::optional<std::string> store;

    bool verify = true;
    size_t threads = 0;
    bool verbose = false;
    bool progress = true;
};

struct InfoConfig
{
    std::string input;
    bool as_json = false;
};

// accepts plain bytes or a B, KiB, MiB, GiB, TiB suffix, throws ConfigError otherwise
uint64_t parse_size(const std::string &size_str);

// log2 of the average chunk size, rounded down
uint32_t filter_bits_for(uint64_t avg_chunk_size);

// applies the keys found in a JSON object onto config, unknown keys are ignored
void apply_pack_config(const json &j, PackConfig &config);
void load_pack_config_file(const std::string &path, PackConfig &config);
