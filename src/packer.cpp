#include <format>
#include <stdexcept>
#include "../include/packer.hpp"
#include "../include/chunk-hasher.hpp"
#include "../include/ordered-queue.hpp"
#include "../include/thread-pool.hpp"
#include "../include/utils.hpp"
#include "../include/version.hpp"

// redraw the progress bar every this many chunks
constexpr uint64_t PROGRESS_INTERVAL = 64;

namespace
{
    // raises the flag when the pipeline is left, so queued workers skip their chunk
    struct StopOnExit
    {
        std::atomic<bool> &flag;
        ~StopOnExit() { flag.store(true); }
    };
}

Packer::Packer(const PackOptions &options, ChunkStore &store, const CancellationToken *token)
    : options(options),
      store(store),
      token(token) {}

ChunkDictionary Packer::pack(std::istream &source, const ChunkLocation &location)
{
    const ChunkerParams &params = options.chunker_params;
    params.validate();

    pack_stats = PackStats{};

    Chunker chunker(params, source);
    Blake2bHasher source_hasher;
    DedupIndex index;
    std::atomic<bool> stopped{false};

    // must outlive the pool, workers push into it until they are joined
    OrderedQueue<ChunkResult> results;

    const size_t threads = options.threads ? options.threads : ThreadPool::default_threads();
    const size_t queue_depth = options.queue_depth ? options.queue_depth : threads * 4;
    ThreadPool pool(threads, queue_depth);
    StopOnExit stop_on_exit{stopped};

    // bounds the chunk data held in memory when the store falls behind
    const uint64_t max_in_flight = queue_depth + pool.size();

    uint64_t submitted = 0;
    uint64_t consumed = 0;

    while (true)
    {
        check_cancelled();

        std::optional<Chunk> chunk = chunker.next();
        if (!chunk)
            break;

        source_hasher.update(chunk->data);

        const uint64_t sequence = submitted++;
        pool.post([this, &results, &index, &stopped, sequence, chunk = std::move(*chunk)]() mutable
                  { results.push(sequence, process_chunk(std::move(chunk), index, stopped)); });

        // take whatever already came back in order
        while (auto result = results.try_pop_next())
        {
            consume(std::move(*result), index);
            consumed++;
        }

        while (submitted - consumed > max_in_flight)
        {
            consume(results.pop_next(), index);
            consumed++;
        }

        if (options.progress_total && submitted % PROGRESS_INTERVAL == 0)
            print_progress_bar("packing", static_cast<double>(chunker.bytes_read()) / static_cast<double>(options.progress_total));
    }

    while (consumed < submitted)
    {
        consume(results.pop_next(), index);
        consumed++;
    }

    store.flush();

    if (options.progress_total)
    {
        print_progress_bar("packing", 1.0);
        std::clog << std::endl;
    }

    ChunkDictionary dictionary;
    dictionary.application_version = CHUNKVAULT_VERSION;
    dictionary.source_checksum = source_hasher.finalize();
    dictionary.source_total_size = chunker.bytes_read();
    dictionary.chunk_data_location = location;
    dictionary.chunker_params = params;
    dictionary.chunk_descriptors = index.take_descriptors();

    pack_stats.source_bytes = dictionary.source_total_size;

    return dictionary;
}

const PackStats &Packer::stats() const
{
    return pack_stats;
}

// runs on a worker: strong hash, and compression unless the chunk is a known duplicate
Packer::ChunkResult Packer::process_chunk(Chunk chunk, const DedupIndex &index, const std::atomic<bool> &stopped) const
{
    ChunkResult result;
    result.offset = chunk.offset;
    result.source_size = chunk.data.size();

    if (stopped.load())
        return result;

    try
    {
        result.checksum = Blake2bHasher::checksum(chunk.data, options.chunker_params.chunk_hash_length);

        // the index only holds earlier chunks here, so a hit is always a repeat
        if (!index.contains(result.checksum))
            result.encoded = encode_chunk(chunk.data, options.compression);
    }
    catch (...)
    {
        // rethrown in order by consume()
        result.error = std::current_exception();
    }

    return result;
}

// runs in sequence order on the packing thread
void Packer::consume(ChunkResult result, DedupIndex &index)
{
    if (result.error)
        std::rethrow_exception(result.error);

    pack_stats.chunks++;

    const auto occurrence = index.record(result.checksum, result.offset, result.source_size);

    if (!occurrence.first)
    {
        if (options.verbose)
            std::clog << std::format("Chunk '{}', offset: {}, size: {}, duplicate",
                                     to_hex(result.checksum), result.offset, size_to_string(result.source_size))
                      << std::endl;
        return;
    }

    if (!result.encoded)
        throw std::logic_error(std::format("first occurrence of chunk {} was not encoded", to_hex(result.checksum)));

    check_cancelled();

    const ChunkPlacement placement = store.put(result.checksum, result.encoded->data);
    index.set_placement(occurrence.descriptor_index, placement.archive_offset, placement.archive_size, result.encoded->compression);

    if (options.verbose)
        std::clog << std::format("Chunk {}, '{}', offset: {}, size: {}, stored as: {}",
                                 pack_stats.unique_chunks,
                                 to_hex(result.checksum),
                                 result.offset,
                                 size_to_string(result.source_size),
                                 size_to_string(result.encoded->data.size()))
                  << std::endl;

    pack_stats.unique_chunks++;
    pack_stats.unique_bytes += result.source_size;
    pack_stats.stored_bytes += result.encoded->data.size();
}

void Packer::check_cancelled() const
{
    if (token)
        token->throw_if_cancelled();
}
