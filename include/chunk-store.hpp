#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "chunk-dictionary.hpp"
#include "file-io.hpp"

namespace fs = std::filesystem;

struct ChunkPlacement
{
    uint64_t archive_offset = 0;
    uint64_t archive_size = 0;
};

// physical storage of chunk bytes, safe to use from several threads
class ChunkStore
{
public:
    virtual ~ChunkStore() = default;

    // stores the (possibly compressed) bytes of a chunk
    virtual ChunkPlacement put(const std::string &checksum, const std::string &data) = 0;

    // returns the stored bytes, throws StoreNotFoundError when they are missing
    virtual std::string fetch(const ChunkDescriptor &descriptor) = 0;

    // fetch + decode with the descriptor's compression
    std::string get(const ChunkDescriptor &descriptor);

    virtual void flush() {}
};

// all chunks back to back in one file, addressed by offset and size
class BlobChunkStore : public ChunkStore
{
public:
    enum class Mode
    {
        READ,
        WRITE
    };

    // base_offset is where chunk data starts inside the file
    BlobChunkStore(const fs::path &path, Mode mode, uint64_t base_offset = 0);

    ChunkPlacement put(const std::string &checksum, const std::string &data) override;
    std::string fetch(const ChunkDescriptor &descriptor) override;
    void flush() override;

    uint64_t bytes_written() const;

private:
    mutable std::mutex mtx;
    fs::path file_path;
    std::unique_ptr<FileIO> file;
    uint64_t base_offset;
    uint64_t write_cursor = 0;
};

// chunk data section of an archive, written to a scratch file while packing
class EmbeddedChunkStore : public BlobChunkStore
{
public:
    using BlobChunkStore::BlobChunkStore;
};

// chunk data in a file next to the archive
class ExternalChunkStore : public BlobChunkStore
{
public:
    using BlobChunkStore::BlobChunkStore;
};

// one file per chunk inside a directory
class PerChunkStore : public ChunkStore
{
public:
    explicit PerChunkStore(const fs::path &dir, bool create = false);

    ChunkPlacement put(const std::string &checksum, const std::string &data) override;
    std::string fetch(const ChunkDescriptor &descriptor) override;

    fs::path chunk_path(const std::string &checksum) const;

private:
    fs::path dir;
};

// store to write into while packing, embedded chunks go to scratch_path
std::unique_ptr<ChunkStore> create_chunk_store(const ChunkLocation &location, const fs::path &scratch_path);

// store of an existing archive, store_override replaces the path recorded in the dictionary
std::unique_ptr<ChunkStore> open_chunk_store(const ChunkLocation &location,
                                             const fs::path &archive_path,
                                             uint64_t chunk_data_offset,
                                             const std::optional<std::string> &store_override = std::nullopt);
