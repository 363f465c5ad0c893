#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <istream>
#include <optional>
#include <string>
#include "cancellation.hpp"
#include "chunk-codec.hpp"
#include "chunk-dictionary.hpp"
#include "chunk-store.hpp"
#include "chunker.hpp"
#include "dedup-index.hpp"

struct PackOptions
{
    ChunkerParams chunker_params;

    // chunks are stored raw when not set
    std::optional<Compression> compression = Compression{};

    // 0 picks the hardware concurrency
    size_t threads = 0;

    // chunks waiting for a worker, 0 means four per worker
    size_t queue_depth = 0;

    bool verbose = false;

    // expected source size for the progress bar, 0 hides it
    uint64_t progress_total = 0;
};

struct PackStats
{
    uint64_t chunks = 0;
    uint64_t unique_chunks = 0;
    uint64_t source_bytes = 0;
    uint64_t unique_bytes = 0;
    uint64_t stored_bytes = 0;
};

// chunks a source, stores every unique chunk once and builds its dictionary
class Packer
{
public:
    Packer(const PackOptions &options, ChunkStore &store, const CancellationToken *token = nullptr);

    // location is recorded in the dictionary, the store must write to it
    ChunkDictionary pack(std::istream &source, const ChunkLocation &location);

    const PackStats &stats() const;

private:
    // what a worker hands back for one chunk
    struct ChunkResult
    {
        uint64_t offset = 0;
        uint64_t source_size = 0;
        std::string checksum;

        // only set when the checksum wasn't known to the index yet
        std::optional<EncodedChunk> encoded;
        std::exception_ptr error;
    };

    PackOptions options;
    ChunkStore &store;
    const CancellationToken *token;
    PackStats pack_stats;

    ChunkResult process_chunk(Chunk chunk, const DedupIndex &index, const std::atomic<bool> &stopped) const;
    void consume(ChunkResult result, DedupIndex &index);
    void check_cancelled() const;
};
