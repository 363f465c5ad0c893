#include <algorithm>
#include <format>
#include <limits>
#include <unordered_set>
#include "../include/chunk-dictionary.hpp"
#include "../include/errors.hpp"
#include "../include/utils.hpp"
#include "chunk-dictionary.pb.h"

// highest LZMA preset
constexpr uint32_t MAX_COMPRESSION_LEVEL = 9;

void validate_dictionary(const ChunkDictionary &dictionary)
{
    if (dictionary.source_checksum.empty())
        throw DictionaryInvalidError("dictionary has no source checksum");

    if (dictionary.chunker_params)
    {
        try
        {
            dictionary.chunker_params->validate();
        }
        catch (const ConfigError &e)
        {
            throw DictionaryInvalidError(std::format("dictionary has invalid chunker parameters: {}", e.what()));
        }
    }

    std::unordered_set<std::string> checksums;
    std::vector<std::pair<uint64_t, uint64_t>> placements;

    for (size_t i = 0; i < dictionary.chunk_descriptors.size(); i++)
    {
        const auto &descriptor = dictionary.chunk_descriptors[i];

        if (descriptor.checksum.empty())
            throw DictionaryInvalidError(std::format("chunk {} has no checksum", i));

        if (!checksums.insert(descriptor.checksum).second)
            throw DictionaryInvalidError(std::format("chunk {} repeats checksum {}", i, to_hex(descriptor.checksum)));

        if (descriptor.source_size == 0)
            throw DictionaryInvalidError(std::format("chunk {} has zero source size", i));

        if (descriptor.source_offsets.empty())
            throw DictionaryInvalidError(std::format("chunk {} is not referenced by any source offset", i));

        if (descriptor.compression && descriptor.compression->level > MAX_COMPRESSION_LEVEL)
            throw DictionaryInvalidError(std::format("chunk {} has invalid compression level {}", i, descriptor.compression->level));

        if (!std::is_sorted(descriptor.source_offsets.begin(), descriptor.source_offsets.end()))
            throw DictionaryInvalidError(std::format("chunk {} source offsets are not ascending", i));

        for (const uint64_t offset : descriptor.source_offsets)
        {
            if (offset > std::numeric_limits<uint64_t>::max() - descriptor.source_size)
                throw DictionaryInvalidError(std::format("chunk {} at offset {} overflows", i, offset));

            placements.emplace_back(offset, descriptor.source_size);
        }
    }

    std::sort(placements.begin(), placements.end());

    // every placement has to start exactly where the previous one ended
    uint64_t cursor = 0;
    for (const auto &[offset, size] : placements)
    {
        if (offset < cursor)
            throw DictionaryInvalidError(std::format("chunks overlap at source offset {}", offset));

        if (offset > cursor)
            throw DictionaryInvalidError(std::format("gap in source between {} and {}", cursor, offset));

        cursor = offset + size;
    }

    if (cursor != dictionary.source_total_size)
        throw DictionaryInvalidError(std::format("chunks cover {} bytes but source size is {}", cursor, dictionary.source_total_size));
}

std::string serialize_dictionary(const ChunkDictionary &dictionary)
{
    chunkvault::wire::ChunkDictionary pb;

    pb.set_application_version(dictionary.application_version);
    pb.set_source_checksum(dictionary.source_checksum);
    pb.set_source_total_size(dictionary.source_total_size);

    if (const auto *external = std::get_if<ExternalLocation>(&dictionary.chunk_data_location))
        pb.set_external(external->path);
    else if (const auto *per_chunk = std::get_if<PerChunkLocation>(&dictionary.chunk_data_location))
        pb.set_per_chunk(per_chunk->dir);

    if (dictionary.chunker_params)
    {
        const auto &params = *dictionary.chunker_params;
        auto *pb_params = pb.mutable_chunker_params();

        pb_params->set_chunk_filter_bits(params.chunk_filter_bits);
        pb_params->set_min_chunk_size(params.min_chunk_size);
        pb_params->set_max_chunk_size(params.max_chunk_size);
        pb_params->set_hash_window_size(params.hash_window_size);
        pb_params->set_chunk_hash_length(params.chunk_hash_length);
    }

    for (const auto &descriptor : dictionary.chunk_descriptors)
    {
        auto *pb_descriptor = pb.add_chunk_descriptors();

        pb_descriptor->set_checksum(descriptor.checksum);

        if (descriptor.compression)
            pb_descriptor->set_lzma(descriptor.compression->level);

        pb_descriptor->set_archive_size(descriptor.archive_size);
        pb_descriptor->set_archive_offset(descriptor.archive_offset);
        pb_descriptor->set_source_size(descriptor.source_size);

        for (const uint64_t offset : descriptor.source_offsets)
            pb_descriptor->add_source_offsets(offset);
    }

    std::string data;
    if (!pb.SerializeToString(&data))
        throw DictionaryInvalidError("failed to serialize dictionary");

    return data;
}

ChunkDictionary parse_dictionary(std::string_view data)
{
    if (data.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
        throw DictionaryInvalidError(std::format("dictionary of {} bytes is too large", data.size()));

    chunkvault::wire::ChunkDictionary pb;

    if (!pb.ParseFromArray(data.data(), static_cast<int>(data.size())))
        throw DictionaryInvalidError("failed to parse dictionary");

    ChunkDictionary dictionary;
    dictionary.application_version = pb.application_version();
    dictionary.source_checksum = pb.source_checksum();
    dictionary.source_total_size = pb.source_total_size();

    switch (pb.chunk_data_location_case())
    {
    case chunkvault::wire::ChunkDictionary::kExternal:
        dictionary.chunk_data_location = ExternalLocation{pb.external()};
        break;
    case chunkvault::wire::ChunkDictionary::kPerChunk:
        dictionary.chunk_data_location = PerChunkLocation{pb.per_chunk()};
        break;
    default:
        dictionary.chunk_data_location = EmbeddedLocation{};
        break;
    }

    if (pb.has_chunker_params())
    {
        const auto &pb_params = pb.chunker_params();

        dictionary.chunker_params = ChunkerParams{
            .chunk_filter_bits = pb_params.chunk_filter_bits(),
            .min_chunk_size = pb_params.min_chunk_size(),
            .max_chunk_size = pb_params.max_chunk_size(),
            .hash_window_size = pb_params.hash_window_size(),
            .chunk_hash_length = pb_params.chunk_hash_length()};
    }

    dictionary.chunk_descriptors.reserve(static_cast<size_t>(pb.chunk_descriptors_size()));

    for (const auto &pb_descriptor : pb.chunk_descriptors())
    {
        ChunkDescriptor descriptor;
        descriptor.checksum = pb_descriptor.checksum();

        if (pb_descriptor.has_lzma())
            descriptor.compression = Compression{CompressionType::LZMA, pb_descriptor.lzma()};

        descriptor.archive_size = pb_descriptor.archive_size();
        descriptor.archive_offset = pb_descriptor.archive_offset();
        descriptor.source_size = pb_descriptor.source_size();
        descriptor.source_offsets.assign(pb_descriptor.source_offsets().begin(), pb_descriptor.source_offsets().end());

        dictionary.chunk_descriptors.push_back(std::move(descriptor));
    }

    return dictionary;
}

std::string location_to_string(const ChunkLocation &location)
{
    if (const auto *external = std::get_if<ExternalLocation>(&location))
        return std::format("external file {}", external->path);

    if (const auto *per_chunk = std::get_if<PerChunkLocation>(&location))
        return std::format("per chunk directory {}", per_chunk->dir);

    return "embedded";
}

json dictionary_to_json(const ChunkDictionary &dictionary)
{
    json j = json::object();

    j["application_version"] = dictionary.application_version;
    j["source_checksum"] = to_hex(dictionary.source_checksum);
    j["source_total_size"] = dictionary.source_total_size;

    if (const auto *external = std::get_if<ExternalLocation>(&dictionary.chunk_data_location))
        j["external"] = external->path;
    else if (const auto *per_chunk = std::get_if<PerChunkLocation>(&dictionary.chunk_data_location))
        j["per_chunk"] = per_chunk->dir;

    if (dictionary.chunker_params)
        j["chunker_params"] = *dictionary.chunker_params;

    j["chunk_descriptors"] = json::array();

    for (const auto &descriptor : dictionary.chunk_descriptors)
    {
        json descriptor_json = {
            {"checksum", to_hex(descriptor.checksum)},
            {"archive_size", descriptor.archive_size},
            {"archive_offset", descriptor.archive_offset},
            {"source_size", descriptor.source_size},
            {"source_offsets", descriptor.source_offsets}};

        if (descriptor.compression)
            descriptor_json["LZMA"] = descriptor.compression->level;

        j["chunk_descriptors"].push_back(std::move(descriptor_json));
    }

    return j;
}
