#include <format>
#include <future>
#include <unordered_map>
#include "../include/unpacker.hpp"
#include "../include/chunk-hasher.hpp"
#include "../include/chunker.hpp"
#include "../include/errors.hpp"
#include "../include/thread-pool.hpp"
#include "../include/utils.hpp"

// block size used when hashing the rebuilt file
constexpr size_t VERIFY_READ_SIZE = 1024 * 1024;

Unpacker::Unpacker(const UnpackOptions &options, const CancellationToken *token)
    : options(options),
      token(token) {}

void Unpacker::unpack(const ChunkDictionary &dictionary, ChunkStore &store, FileIO &destination)
{
    // nothing gets written unless the dictionary tiles the whole source
    validate_dictionary(dictionary);

    chunks_from_seed = 0;
    chunks_from_store = 0;
    bytes_written = 0;

    destination.flush();

    std::error_code ec;
    fs::resize_file(destination.get_filepath(), dictionary.source_total_size, ec);
    if (ec)
        throw IoError(std::format("failed to resize {}: {}", destination.get_filepath(), ec.message()));

    const std::vector<bool> placed = place_from_seeds(dictionary, destination);

    place_from_store(dictionary, placed, store, destination);

    destination.flush();

    if (options.verify)
        verify(dictionary, destination);
}

UnpackStats Unpacker::stats() const
{
    return UnpackStats{chunks_from_seed.load(), chunks_from_store.load(), bytes_written.load()};
}

// re-chunks every seed with the dictionary's parameters and places the chunks it finds
std::vector<bool> Unpacker::place_from_seeds(const ChunkDictionary &dictionary, FileIO &destination)
{
    std::vector<bool> placed(dictionary.chunk_descriptors.size(), false);

    if (options.seed_files.empty())
        return placed;

    if (!dictionary.chunker_params)
    {
        std::cerr << "dictionary has no chunker parameters, ignoring seed files" << std::endl;
        return placed;
    }

    const ChunkerParams &params = *dictionary.chunker_params;

    std::unordered_map<std::string, size_t> wanted;
    for (size_t i = 0; i < dictionary.chunk_descriptors.size(); i++)
        wanted.emplace(dictionary.chunk_descriptors[i].checksum, i);

    for (const auto &seed_path : options.seed_files)
    {
        if (wanted.empty())
            break;

        std::ifstream seed(seed_path, std::ios::binary);
        if (!seed)
            throw IoError(std::format("failed to open seed file {}", seed_path));

        uint64_t found = 0;
        Chunker chunker(params, seed);

        while (auto chunk = chunker.next())
        {
            check_cancelled();

            const std::string checksum = Blake2bHasher::checksum(chunk->data, params.chunk_hash_length);
            const auto it = wanted.find(checksum);

            if (it == wanted.end())
                continue;

            const auto &descriptor = dictionary.chunk_descriptors[it->second];
            if (chunk->data.size() != descriptor.source_size)
                continue;

            place(descriptor, chunk->data, destination);
            placed[it->second] = true;
            wanted.erase(it);
            found++;
        }

        chunks_from_seed += found;
        std::clog << std::format("used {} chunks from seed {}", found, seed_path) << std::endl;
    }

    return placed;
}

// fetches and decodes the remaining chunks in parallel, the first failure is rethrown once all queued placements finished
void Unpacker::place_from_store(const ChunkDictionary &dictionary, const std::vector<bool> &placed, ChunkStore &store, FileIO &destination)
{
    const size_t threads = options.threads ? options.threads : ThreadPool::default_threads();

    std::vector<std::future<void>> placements;
    std::exception_ptr first_error;
    {
        ThreadPool pool(threads, threads * 4);

        for (size_t i = 0; i < dictionary.chunk_descriptors.size(); i++)
        {
            if (placed[i])
                continue;

            const auto &descriptor = dictionary.chunk_descriptors[i];

            placements.push_back(pool.submit([this, &descriptor, &store, &destination]
                                             {
                                                 check_cancelled();

                                                 const std::string data = store.get(descriptor);
                                                 place(descriptor, data, destination);
                                                 chunks_from_store++; }));
        }

        for (size_t i = 0; i < placements.size(); i++)
        {
            try
            {
                placements[i].get();
            }
            catch (const std::exception &e)
            {
                // keep the first failure, independent placements still run to the end
                if (!first_error)
                    first_error = std::current_exception();
                else
                    std::cerr << "another chunk failed: " << e.what() << std::endl;
            }

            if (options.progress && dictionary.source_total_size)
                print_progress_bar("unpacking", static_cast<double>(bytes_written.load()) / static_cast<double>(dictionary.source_total_size));
        }
    }

    if (options.progress && dictionary.source_total_size)
        std::clog << std::endl;

    if (first_error)
        std::rethrow_exception(first_error);
}

// writes the chunk at every offset it occurs in the source
void Unpacker::place(const ChunkDescriptor &descriptor, const std::string &data, FileIO &destination)
{
    std::lock_guard<std::mutex> lock(destination_mtx);

    for (const uint64_t offset : descriptor.source_offsets)
    {
        destination.write_file_at_offset(offset, data);
        bytes_written += data.size();
    }

    if (options.verbose)
        std::clog << std::format("placed chunk '{}' ({}) at {} offsets",
                                 to_hex(descriptor.checksum),
                                 size_to_string(descriptor.source_size),
                                 descriptor.source_offsets.size())
                  << std::endl;
}

void Unpacker::verify(const ChunkDictionary &dictionary, FileIO &destination) const
{
    const uintmax_t size = destination.get_file_size();
    if (size != dictionary.source_total_size)
        throw VerificationError(std::format("rebuilt file is {} bytes, expected {}", size, dictionary.source_total_size));

    Blake2bHasher hasher;
    for (uint64_t offset = 0; offset < size;)
    {
        check_cancelled();

        const std::string block = destination.read_file_from_offset(offset, VERIFY_READ_SIZE);
        if (block.empty())
            throw IoError(std::format("unexpected end of {} at offset {}", destination.get_filepath(), offset));

        hasher.update(block);
        offset += block.size();
    }

    const std::string checksum = hasher.finalize();
    if (checksum != dictionary.source_checksum)
        throw VerificationError(std::format("checksum mismatch, rebuilt file is {} but source was {}",
                                            to_hex(checksum), to_hex(dictionary.source_checksum)));
}

void Unpacker::check_cancelled() const
{
    if (token)
        token->throw_if_cancelled();
}
