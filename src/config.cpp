#include <algorithm>
#include <bit>
#include <cctype>
#include <charconv>
#include <format>
#include <fstream>
#include <limits>
#include "../include/config.hpp"
#include "../include/errors.hpp"

void PackConfig::validate() const
{
    if (output.empty())
        throw ConfigError("no output file given");

    if (chunk_file && chunk_dir)
        throw ConfigError("chunk file and chunk directory can't be used together");

    if (avg_chunk_size == 0)
        throw ConfigError("average chunk size must be greater than zero");

    if (min_chunk_size > avg_chunk_size)
        throw ConfigError(std::format("min chunk size {} > average chunk size {}", min_chunk_size, avg_chunk_size));

    if (max_chunk_size < avg_chunk_size)
        throw ConfigError(std::format("max chunk size {} < average chunk size {}", max_chunk_size, avg_chunk_size));

    if (compression != "LZMA" && compression != "NONE")
        throw ConfigError(std::format("unknown compression {}, use LZMA or NONE", compression));

    if (compression_level > 9)
        throw ConfigError(std::format("compression level {} not within 0-9", compression_level));

    chunker_params().validate();
}

ChunkerParams PackConfig::chunker_params() const
{
    return ChunkerParams{
        .chunk_filter_bits = filter_bits_for(avg_chunk_size),
        .min_chunk_size = min_chunk_size,
        .max_chunk_size = max_chunk_size,
        .hash_window_size = hash_window_size,
        .chunk_hash_length = chunk_hash_length};
}

std::optional<Compression> PackConfig::chunk_compression() const
{
    if (compression == "NONE")
        return std::nullopt;

    return Compression{CompressionType::LZMA, compression_level};
}

ChunkLocation PackConfig::chunk_location() const
{
    if (chunk_file)
        return ExternalLocation{*chunk_file};

    if (chunk_dir)
        return PerChunkLocation{*chunk_dir};

    return EmbeddedLocation{};
}

uint64_t parse_size(const std::string &size_str)
{
    size_t digits = 0;
    while (digits < size_str.size() && std::isdigit(static_cast<unsigned char>(size_str[digits])))
        digits++;

    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(size_str.data(), size_str.data() + digits, value);
    if (digits == 0 || ec != std::errc())
        throw ConfigError(std::format("invalid size '{}'", size_str));

    const std::string unit = size_str.substr(digits);

    uint64_t multiplier;
    if (unit.empty() || unit == "B")
        multiplier = 1;
    else if (unit == "KiB")
        multiplier = uint64_t{1} << 10;
    else if (unit == "MiB")
        multiplier = uint64_t{1} << 20;
    else if (unit == "GiB")
        multiplier = uint64_t{1} << 30;
    else if (unit == "TiB")
        multiplier = uint64_t{1} << 40;
    else
        throw ConfigError(std::format("invalid size unit '{}' in '{}'", unit, size_str));

    if (value > std::numeric_limits<uint64_t>::max() / multiplier)
        throw ConfigError(std::format("size '{}' is too large", size_str));

    return value * multiplier;
}

uint32_t filter_bits_for(uint64_t avg_chunk_size)
{
    if (avg_chunk_size == 0)
        return 0;

    const auto bits = static_cast<uint32_t>(std::bit_width(avg_chunk_size) - 1);
    return std::min<uint32_t>(bits, 32);
}

// size values may be numbers or strings like "64KiB"
static uint64_t size_value(const json &value, const std::string &key)
{
    if (value.is_number_unsigned() || (value.is_number_integer() && value.get<int64_t>() >= 0))
        return value.get<uint64_t>();

    if (value.is_string())
        return parse_size(value.get<std::string>());

    throw ConfigError(std::format("config key {} must be a size", key));
}

void apply_pack_config(const json &j, PackConfig &config)
{
    if (!j.is_object())
        throw ConfigError("pack config must be a JSON object");

    try
    {
        if (j.contains("avg_chunk_size"))
            config.avg_chunk_size = size_value(j["avg_chunk_size"], "avg_chunk_size");
        if (j.contains("min_chunk_size"))
            config.min_chunk_size = size_value(j["min_chunk_size"], "min_chunk_size");
        if (j.contains("max_chunk_size"))
            config.max_chunk_size = size_value(j["max_chunk_size"], "max_chunk_size");
        if (j.contains("hash_window_size"))
            config.hash_window_size = static_cast<uint32_t>(size_value(j["hash_window_size"], "hash_window_size"));

        config.chunk_hash_length = j.value("chunk_hash_length", config.chunk_hash_length);
        config.compression = j.value("compression", config.compression);
        config.compression_level = j.value("compression_level", config.compression_level);
        config.threads = j.value("threads", config.threads);
        config.verbose = j.value("verbose", config.verbose);
        config.progress = j.value("progress", config.progress);

        if (j.contains("chunk_file"))
            config.chunk_file = j["chunk_file"].get<std::string>();
        if (j.contains("chunk_dir"))
            config.chunk_dir = j["chunk_dir"].get<std::string>();
    }
    catch (const json::exception &e)
    {
        throw ConfigError(std::format("invalid pack config: {}", e.what()));
    }
}

void load_pack_config_file(const std::string &path, PackConfig &config)
{
    std::ifstream file(path);

    if (!file.is_open())
        throw ConfigError(std::format("failed to open config file {}", path));

    json j;
    try
    {
        file >> j;
    }
    catch (const json::parse_error &e)
    {
        throw ConfigError(std::format("failed to parse config file {}: {}", path, e.what()));
    }

    apply_pack_config(j, config);
}
