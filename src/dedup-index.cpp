#include <utility>
#include "../include/dedup-index.hpp"

DedupIndex::Occurrence DedupIndex::record(const std::string &checksum, uint64_t source_offset, uint64_t source_size)
{
    std::lock_guard<std::mutex> lock(mtx);

    const auto [it, inserted] = index.try_emplace(checksum, descriptors.size());

    // equal checksum is taken as equal content, bytes are never compared
    if (!inserted)
    {
        descriptors[it->second].source_offsets.push_back(source_offset);
        return Occurrence{it->second, false};
    }

    ChunkDescriptor descriptor;
    descriptor.checksum = checksum;
    descriptor.source_size = source_size;
    descriptor.source_offsets.push_back(source_offset);
    descriptors.push_back(std::move(descriptor));

    return Occurrence{it->second, true};
}

bool DedupIndex::contains(const std::string &checksum) const
{
    std::lock_guard<std::mutex> lock(mtx);
    return index.contains(checksum);
}

void DedupIndex::set_placement(size_t descriptor_index, uint64_t archive_offset, uint64_t archive_size, const std::optional<Compression> &compression)
{
    std::lock_guard<std::mutex> lock(mtx);

    auto &descriptor = descriptors.at(descriptor_index);
    descriptor.archive_offset = archive_offset;
    descriptor.archive_size = archive_size;
    descriptor.compression = compression;
}

size_t DedupIndex::unique_chunks() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return descriptors.size();
}

std::vector<ChunkDescriptor> DedupIndex::take_descriptors()
{
    std::lock_guard<std::mutex> lock(mtx);

    index.clear();
    return std::exchange(descriptors, {});
}
