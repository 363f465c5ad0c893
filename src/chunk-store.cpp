#include <format>
#include <type_traits>
#include <variant>
#include "../include/chunk-store.hpp"
#include "../include/chunk-codec.hpp"
#include "../include/errors.hpp"
#include "../include/utils.hpp"

std::string ChunkStore::get(const ChunkDescriptor &descriptor)
{
    return decode_chunk(fetch(descriptor), descriptor);
}

BlobChunkStore::BlobChunkStore(const fs::path &path, Mode mode, uint64_t base_offset)
    : file_path(path),
      base_offset(base_offset)
{
    if (mode == Mode::READ)
    {
        if (!fs::exists(file_path))
            throw StoreNotFoundError(std::format("chunk file {} not found", file_path.string()));

        file = std::make_unique<FileIO>(file_path.string(), std::ios::in);
    }
    else
        file = std::make_unique<FileIO>(file_path.string(), std::ios::out | std::ios::trunc);
}

// appends at the write cursor
ChunkPlacement BlobChunkStore::put(const std::string &, const std::string &data)
{
    std::lock_guard<std::mutex> lock(mtx);

    file->append_chunk(data);

    ChunkPlacement placement{write_cursor, data.size()};
    write_cursor += data.size();

    return placement;
}

std::string BlobChunkStore::fetch(const ChunkDescriptor &descriptor)
{
    std::string data;
    {
        std::lock_guard<std::mutex> lock(mtx);
        data = file->read_file_from_offset(base_offset + descriptor.archive_offset, descriptor.archive_size);
    }

    // a truncated file means the chunk is gone
    if (data.size() != descriptor.archive_size)
        throw StoreNotFoundError(std::format("chunk {} at offset {} ({} bytes) is beyond the end of {}",
                                             to_hex(descriptor.checksum),
                                             descriptor.archive_offset,
                                             descriptor.archive_size,
                                             file_path.string()));

    return data;
}

void BlobChunkStore::flush()
{
    std::lock_guard<std::mutex> lock(mtx);
    file->flush();
}

uint64_t BlobChunkStore::bytes_written() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return write_cursor;
}

PerChunkStore::PerChunkStore(const fs::path &dir, bool create) : dir(dir)
{
    // if directory not exists then create it
    std::error_code ec;
    if (create && !fs::exists(dir) && !fs::create_directories(dir, ec))
        throw IoError(std::format("failed to create chunk directory {}: {}", dir.string(), ec.message()));

    if (!fs::is_directory(dir))
        throw StoreNotFoundError(std::format("chunk directory {} not found", dir.string()));
}

fs::path PerChunkStore::chunk_path(const std::string &checksum) const
{
    return dir / std::format("{}.chunk", to_hex(checksum));
}

// writes into a .incoming file first so a reader never sees a half written chunk
ChunkPlacement PerChunkStore::put(const std::string &checksum, const std::string &data)
{
    const fs::path final_path = chunk_path(checksum);
    const fs::path temp_path = final_path.string() + ".incoming";

    {
        FileIO chunk_file(temp_path.string(), std::ios::out | std::ios::trunc);
        chunk_file.append_chunk(data);
        chunk_file.flush();
    }

    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec)
        throw IoError(std::format("failed to move chunk into {}: {}", final_path.string(), ec.message()));

    return ChunkPlacement{};
}

std::string PerChunkStore::fetch(const ChunkDescriptor &descriptor)
{
    const fs::path path = chunk_path(descriptor.checksum);

    if (!fs::exists(path))
        throw StoreNotFoundError(std::format("chunk file {} not found", path.string()));

    FileIO chunk_file(path.string(), std::ios::in);
    return chunk_file.read_file_from_offset(0, static_cast<size_t>(chunk_file.get_file_size()));
}

std::unique_ptr<ChunkStore> create_chunk_store(const ChunkLocation &location, const fs::path &scratch_path)
{
    return std::visit(
        [&](const auto &loc) -> std::unique_ptr<ChunkStore>
        {
            using T = std::decay_t<decltype(loc)>;

            if constexpr (std::is_same_v<T, ExternalLocation>)
                return std::make_unique<ExternalChunkStore>(loc.path, BlobChunkStore::Mode::WRITE);
            else if constexpr (std::is_same_v<T, PerChunkLocation>)
                return std::make_unique<PerChunkStore>(loc.dir, true);
            else
                return std::make_unique<EmbeddedChunkStore>(scratch_path, BlobChunkStore::Mode::WRITE);
        },
        location);
}

std::unique_ptr<ChunkStore> open_chunk_store(const ChunkLocation &location,
                                             const fs::path &archive_path,
                                             uint64_t chunk_data_offset,
                                             const std::optional<std::string> &store_override)
{
    return std::visit(
        [&](const auto &loc) -> std::unique_ptr<ChunkStore>
        {
            using T = std::decay_t<decltype(loc)>;

            if constexpr (std::is_same_v<T, ExternalLocation>)
            {
                const fs::path path = store_override ? fs::path(*store_override) : resolve_relative_to(archive_path, loc.path);
                return std::make_unique<ExternalChunkStore>(path, BlobChunkStore::Mode::READ);
            }
            else if constexpr (std::is_same_v<T, PerChunkLocation>)
            {
                const fs::path dir = store_override ? fs::path(*store_override) : resolve_relative_to(archive_path, loc.dir);
                return std::make_unique<PerChunkStore>(dir);
            }
            else
            {
                if (store_override)
                    throw ConfigError("chunk data is embedded in the archive, a store path can't be given");

                return std::make_unique<EmbeddedChunkStore>(archive_path, BlobChunkStore::Mode::READ, chunk_data_offset);
            }
        },
        location);
}
