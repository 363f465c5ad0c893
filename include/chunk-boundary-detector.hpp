#pragma once
#include <cstdint>
#include <memory>
#include "chunker-params.hpp"
#include "rolling-hash.hpp"

// decides after every byte whether the current chunk ends there
class ChunkBoundaryDetector
{
public:
    enum class State
    {
        ACCUMULATING,
        BOUNDARY_EMITTED
    };

    explicit ChunkBoundaryDetector(const ChunkerParams &params);
    ChunkBoundaryDetector(const ChunkerParams &params, std::unique_ptr<RollingHash> hasher);

    // returns true when the byte just pushed is the last one of a chunk
    bool push(uint8_t byte);

    // bytes in the current chunk so far
    uint64_t accumulated() const;
    State state() const;
    void reset();

private:
    std::unique_ptr<RollingHash> hasher;
    uint64_t min_chunk_size;
    uint64_t max_chunk_size;
    uint32_t mask;
    uint32_t target;

    // bytes before this position can't be inside the window at a testable length
    uint64_t hash_input_start;

    uint64_t length = 0;
    State current_state = State::ACCUMULATING;

    void start_chunk();
};
