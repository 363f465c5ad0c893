#include <format>
#include "../include/chunker.hpp"
#include "../include/errors.hpp"

static const ChunkerParams &validated(const ChunkerParams &params)
{
    params.validate();
    return params;
}

Chunker::Chunker(const ChunkerParams &params, std::istream &source)
    : detector(validated(params)),
      source(source)
{
    buffer.reserve(CHUNKER_BUFFER_SIZE);
}

std::optional<Chunk> Chunker::next()
{
    while (true)
    {
        // scan the buffered bytes for the next boundary
        while (scan_pos < buffer.size())
        {
            const auto byte = static_cast<uint8_t>(buffer[scan_pos++]);

            if (detector.push(byte))
                return take_chunk();
        }

        if (!end_of_stream && fill_buffer())
            continue;

        end_of_stream = true;

        // whatever is left becomes the last chunk, even below the min size
        if (chunk_begin < buffer.size())
        {
            Chunk last = take_chunk();
            detector.reset();
            return last;
        }

        return std::nullopt;
    }
}

uint64_t Chunker::bytes_read() const
{
    return total_read;
}

// drop already emitted bytes and read the next block, false at end of stream
bool Chunker::fill_buffer()
{
    buffer.erase(0, chunk_begin);
    scan_pos -= chunk_begin;
    chunk_begin = 0;

    const size_t old_size = buffer.size();
    buffer.resize(old_size + CHUNKER_BUFFER_SIZE);

    source.read(buffer.data() + old_size, static_cast<std::streamsize>(CHUNKER_BUFFER_SIZE));
    const auto bytes_read = static_cast<size_t>(source.gcount());

    if (source.bad() || (source.fail() && !source.eof()))
        throw IoError(std::format("failed to read source after {} bytes", total_read + bytes_read));

    buffer.resize(old_size + bytes_read);
    total_read += bytes_read;

    return bytes_read > 0;
}

Chunk Chunker::take_chunk()
{
    Chunk chunk{chunk_offset, buffer.substr(chunk_begin, scan_pos - chunk_begin)};

    chunk_offset += chunk.data.size();
    chunk_begin = scan_pos;

    return chunk;
}
