#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "cancellation.hpp"
#include "chunk-dictionary.hpp"
#include "chunk-store.hpp"
#include "file-io.hpp"

struct UnpackOptions
{
    // 0 picks the hardware concurrency
    size_t threads = 0;

    // compare the rebuilt file against the source checksum
    bool verify = true;

    bool verbose = false;
    bool progress = false;

    // local files re-chunked to find chunks without touching the store
    std::vector<std::string> seed_files;
};

struct UnpackStats
{
    uint64_t chunks_from_seed = 0;
    uint64_t chunks_from_store = 0;
    uint64_t bytes_written = 0;
};

// rebuilds a source file from its dictionary and chunk store
class Unpacker
{
public:
    explicit Unpacker(const UnpackOptions &options, const CancellationToken *token = nullptr);

    // throws before writing anything when the dictionary is invalid
    void unpack(const ChunkDictionary &dictionary, ChunkStore &store, FileIO &destination);

    UnpackStats stats() const;

private:
    UnpackOptions options;
    const CancellationToken *token;

    // serializes writes into the shared destination
    std::mutex destination_mtx;

    std::atomic<uint64_t> chunks_from_seed{0};
    std::atomic<uint64_t> chunks_from_store{0};
    std::atomic<uint64_t> bytes_written{0};

    std::vector<bool> place_from_seeds(const ChunkDictionary &dictionary, FileIO &destination);
    void place_from_store(const ChunkDictionary &dictionary, const std::vector<bool> &placed, ChunkStore &store, FileIO &destination);
    void place(const ChunkDescriptor &descriptor, const std::string &data, FileIO &destination);
    void verify(const ChunkDictionary &dictionary, FileIO &destination) const;
    void check_cancelled() const;
};
