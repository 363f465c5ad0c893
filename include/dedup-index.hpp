#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "chunk-dictionary.hpp"

// maps chunk checksums to their descriptors, kept in order of first occurrence
class DedupIndex
{
public:
    struct Occurrence
    {
        size_t descriptor_index;
        bool first;
    };

    // inserts a descriptor for an unseen checksum, otherwise appends the offset to the existing one
    Occurrence record(const std::string &checksum, uint64_t source_offset, uint64_t source_size);

    bool contains(const std::string &checksum) const;

    // sets where the first occurrence of a chunk got stored
    void set_placement(size_t descriptor_index, uint64_t archive_offset, uint64_t archive_size, const std::optional<Compression> &compression);

    size_t unique_chunks() const;

    // moves the descriptors out, leaving the index empty
    std::vector<ChunkDescriptor> take_descriptors();

private:
    mutable std::mutex mtx;
    std::unordered_map<std::string, size_t> index;
    std::vector<ChunkDescriptor> descriptors;
};
