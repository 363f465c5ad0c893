#include <format>
#include <fstream>
#include "../include/commands.hpp"
#include "../include/archive.hpp"
#include "../include/chunk-store.hpp"
#include "../include/errors.hpp"
#include "../include/packer.hpp"
#include "../include/unpacker.hpp"
#include "../include/utils.hpp"

namespace fs = std::filesystem;

static void ensure_writable(const fs::path &path, bool force_create)
{
    if (fs::exists(path) && !force_create)
        throw ConfigError(std::format("{} already exists, use --force-create to overwrite it", path.string()));
}

// the output is truncated before seeds are read, so a seed can't be the output
static void ensure_not_seed(const fs::path &output_path, const std::vector<std::string> &seed_files)
{
    const fs::path output = fs::weakly_canonical(output_path);

    for (const auto &seed : seed_files)
        if (fs::weakly_canonical(seed) == output)
            throw ConfigError(std::format("seed file {} is also the output file", seed));
}

// paths in the dictionary are kept relative to the archive so the pair can be moved together
static ChunkLocation recorded_location(const ChunkLocation &location, const fs::path &archive_path)
{
    const fs::path archive_dir = fs::absolute(archive_path).parent_path();

    if (const auto *external = std::get_if<ExternalLocation>(&location))
        return ExternalLocation{fs::proximate(fs::absolute(external->path), archive_dir).string()};

    if (const auto *per_chunk = std::get_if<PerChunkLocation>(&location))
        return PerChunkLocation{fs::proximate(fs::absolute(per_chunk->dir), archive_dir).string()};

    return location;
}

void run_pack(const PackConfig &config, const CancellationToken &token)
{
    config.validate();

    const fs::path output_path(config.output);
    ensure_writable(output_path, config.force_create);

    if (config.chunk_file)
        ensure_writable(*config.chunk_file, config.force_create);

    std::ifstream input_file;
    std::istream *input = &std::cin;
    uint64_t input_size = 0;

    if (config.input)
    {
        input_file.open(*config.input, std::ios::binary);
        if (!input_file)
            throw IoError(std::format("failed to open input file {}", *config.input));

        input = &input_file;
        input_size = fs::file_size(*config.input);
    }

    const ChunkLocation location = config.chunk_location();
    const bool embedded = std::holds_alternative<EmbeddedLocation>(location);
    const fs::path scratch_path = output_path.string() + ".chunks.tmp";

    PackOptions options;
    options.chunker_params = config.chunker_params();
    options.compression = config.chunk_compression();
    options.threads = config.threads;
    options.verbose = config.verbose;
    options.progress_total = config.progress ? input_size : 0;

    std::clog << std::format("packing {} into {} ({} chunk data)",
                             config.input.value_or("stdin"), config.output, location_to_string(location))
              << std::endl;

    ChunkDictionary dictionary;
    PackStats stats;
    {
        std::unique_ptr<ChunkStore> store = create_chunk_store(location, scratch_path);

        Packer packer(options, *store, &token);
        dictionary = packer.pack(*input, recorded_location(location, output_path));
        stats = packer.stats();
    }

    write_archive(output_path, dictionary, embedded ? std::optional<fs::path>(scratch_path) : std::nullopt);

    if (embedded)
    {
        std::error_code ec;
        if (!fs::remove(scratch_path, ec))
            std::cerr << std::format("failed to remove scratch file {}: {}", scratch_path.string(), ec.message()) << std::endl;
    }

    std::clog << std::format("Created archive {}", config.output) << std::endl;
    std::clog << std::format("{} chunks, {} unique ({}), stored as {}",
                             stats.chunks,
                             stats.unique_chunks,
                             size_to_string(stats.unique_bytes),
                             size_to_string(stats.stored_bytes))
              << std::endl;
}

void run_unpack(const UnpackConfig &config, const CancellationToken &token)
{
    const fs::path archive_path(config.input);
    const fs::path output_path(config.output);

    ensure_writable(output_path, config.force_create);
    ensure_not_seed(output_path, config.seed_files);

    const ArchiveHeader header = read_archive_header(archive_path);

    // reject a broken dictionary before the output file gets created
    validate_dictionary(header.dictionary);

    std::unique_ptr<ChunkStore> store = open_chunk_store(header.dictionary.chunk_data_location,
                                                         archive_path,
                                                         header.chunk_data_offset,
                                                         config.store);

    UnpackOptions options;
    options.threads = config.threads;
    options.verify = config.verify;
    options.verbose = config.verbose;
    options.progress = config.progress;
    options.seed_files = config.seed_files;

    std::clog << std::format("unpacking {} into {} ({})",
                             config.input, config.output, size_to_string(header.dictionary.source_total_size))
              << std::endl;

    FileIO destination(output_path.string(), std::ios::in | std::ios::out | std::ios::trunc);

    Unpacker unpacker(options, &token);
    unpacker.unpack(header.dictionary, *store, destination);

    const UnpackStats stats = unpacker.stats();
    std::clog << std::format("Unpacked {}, {} chunks from seeds, {} chunks from store{}",
                             config.output,
                             stats.chunks_from_seed,
                             stats.chunks_from_store,
                             config.verify ? ", checksum verified" : "")
              << std::endl;
}

void run_info(const InfoConfig &config)
{
    const ArchiveHeader header = read_archive_header(fs::path(config.input));

    if (config.as_json)
    {
        json j = dictionary_to_json(header.dictionary);
        j["chunk_data_offset"] = header.chunk_data_offset;
        std::cout << j.dump(4) << std::endl;
        return;
    }

    std::cout << std::format("Archive: {}", config.input) << std::endl;
    print_dictionary_summary(std::cout, header.dictionary);
}

void print_dictionary_summary(std::ostream &out, const ChunkDictionary &dictionary)
{
    uint64_t occurrences = 0;
    uint64_t unique_size = 0;
    uint64_t stored_size = 0;
    uint64_t compressed = 0;

    for (const auto &descriptor : dictionary.chunk_descriptors)
    {
        occurrences += descriptor.source_offsets.size();
        unique_size += descriptor.source_size;
        stored_size += descriptor.archive_size;

        if (descriptor.compression)
            compressed++;
    }

    out << std::format("  Built with version: {}", dictionary.application_version) << std::endl;
    out << std::format("  Source checksum: {}", to_hex(dictionary.source_checksum)) << std::endl;
    out << std::format("  Source size: {} ({} bytes)", size_to_string(dictionary.source_total_size), dictionary.source_total_size) << std::endl;
    out << std::format("  Chunk data: {}", location_to_string(dictionary.chunk_data_location)) << std::endl;

    if (dictionary.chunker_params)
    {
        const auto &params = *dictionary.chunker_params;
        out << std::format("  Chunker: filter bits {} (avg {}), min {}, max {}, window {}, hash length {}",
                           params.chunk_filter_bits,
                           size_to_string(uint64_t{1} << params.chunk_filter_bits),
                           size_to_string(params.min_chunk_size),
                           size_to_string(params.max_chunk_size),
                           params.hash_window_size,
                           params.chunk_hash_length)
            << std::endl;
    }

    out << std::format("  Chunks: {} in source, {} unique, {} compressed", occurrences, dictionary.chunk_descriptors.size(), compressed) << std::endl;
    out << std::format("  Unique chunk data: {}", size_to_string(unique_size)) << std::endl;

    // per chunk storage doesn't record stored sizes
    if (!std::holds_alternative<PerChunkLocation>(dictionary.chunk_data_location))
        out << std::format("  Stored chunk data: {}", size_to_string(stored_size)) << std::endl;

    if (unique_size)
        out << std::format("  Deduplication ratio: {:.2f}", static_cast<double>(dictionary.source_total_size) / static_cast<double>(unique_size)) << std::endl;
}
