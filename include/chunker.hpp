#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include "chunk-boundary-detector.hpp"

constexpr size_t CHUNKER_BUFFER_SIZE = 1024 * 1024;

struct Chunk
{
    uint64_t offset;
    std::string data;
};

// splits a stream into content defined chunks, each call to next() yields the following one
class Chunker
{
public:
    Chunker(const ChunkerParams &params, std::istream &source);

    // nullopt once the whole stream has been emitted, throws IoError if the stream fails
    std::optional<Chunk> next();

    uint64_t bytes_read() const;

private:
    ChunkBoundaryDetector detector;
    std::istream &source;

    std::string buffer;
    size_t chunk_begin = 0;
    size_t scan_pos = 0;
    uint64_t chunk_offset = 0;
    uint64_t total_read = 0;
    bool end_of_stream = false;

    bool fill_buffer();
    Chunk take_chunk();
};
