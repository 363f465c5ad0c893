#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "chunk-dictionary.hpp"

// lossless, deterministic transform of one chunk's bytes
class ChunkCodec
{
public:
    virtual ~ChunkCodec() = default;

    virtual std::string encode(std::string_view data, uint32_t level) const = 0;

    // throws CodecError when data is corrupt or doesn't decode to declared_size bytes
    virtual std::string decode(std::string_view data, uint64_t declared_size) const = 0;
};

class IdentityCodec : public ChunkCodec
{
public:
    std::string encode(std::string_view data, uint32_t level) const override;
    std::string decode(std::string_view data, uint64_t declared_size) const override;
};

// xz container with a CRC32 check so corrupt chunks fail to decode
class LzmaCodec : public ChunkCodec
{
public:
    std::string encode(std::string_view data, uint32_t level) const override;
    std::string decode(std::string_view data, uint64_t declared_size) const override;
};

// codec for a descriptor's compression, identity when not set
const ChunkCodec &codec_for(const std::optional<Compression> &compression);

struct EncodedChunk
{
    std::string data;
    std::optional<Compression> compression;
};

// compresses data, falls back to raw storage when compression doesn't shrink it
EncodedChunk encode_chunk(std::string_view data, const std::optional<Compression> &compression);

// decodes stored bytes of a chunk back to its source bytes
std::string decode_chunk(std::string_view stored, const ChunkDescriptor &descriptor);
