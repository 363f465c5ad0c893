#include "../include/chunk-boundary-detector.hpp"

// the mask is derived from the filter bits so they are checked first
static const ChunkerParams &validated(const ChunkerParams &params)
{
    params.validate();
    return params;
}

ChunkBoundaryDetector::ChunkBoundaryDetector(const ChunkerParams &params)
    : ChunkBoundaryDetector(params, std::make_unique<BuzHash>(params.hash_window_size)) {}

ChunkBoundaryDetector::ChunkBoundaryDetector(const ChunkerParams &params, std::unique_ptr<RollingHash> hasher)
    : hasher(std::move(hasher)),
      min_chunk_size(validated(params).min_chunk_size),
      max_chunk_size(params.max_chunk_size),
      mask(params.filter_mask()),
      target(params.filter_mask())
{
    const uint64_t window = this->hasher->window_size();
    hash_input_start = min_chunk_size > window ? min_chunk_size - window : 0;
}

bool ChunkBoundaryDetector::push(uint8_t byte)
{
    // the previous byte closed a chunk so this one opens the next
    if (current_state == State::BOUNDARY_EMITTED)
        start_chunk();

    const uint64_t position = length++;

    if (position >= hash_input_start)
        hasher->push(byte);

    if (length < min_chunk_size)
        return false;

    // hard cap, independent of the content
    bool boundary = length >= max_chunk_size;

    if (!boundary)
        boundary = hasher->valid() && (hasher->current_hash() & mask) == target;

    if (boundary)
        current_state = State::BOUNDARY_EMITTED;

    return boundary;
}

uint64_t ChunkBoundaryDetector::accumulated() const
{
    return length;
}

ChunkBoundaryDetector::State ChunkBoundaryDetector::state() const
{
    return current_state;
}

void ChunkBoundaryDetector::reset()
{
    start_chunk();
}

void ChunkBoundaryDetector::start_chunk()
{
    hasher->reset();
    length = 0;
    current_state = State::ACCUMULATING;
}
