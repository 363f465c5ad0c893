#include <format>
#include <limits>
#include <lzma.h>
#include "../include/chunk-codec.hpp"
#include "../include/errors.hpp"
#include "../include/utils.hpp"

std::string IdentityCodec::encode(std::string_view data, uint32_t) const
{
    return std::string(data);
}

std::string IdentityCodec::decode(std::string_view data, uint64_t declared_size) const
{
    if (data.size() != declared_size)
        throw CodecError(std::format("raw chunk holds {} bytes, expected {}", data.size(), declared_size));

    return std::string(data);
}

std::string LzmaCodec::encode(std::string_view data, uint32_t level) const
{
    if (level > 9)
        throw ConfigError(std::format("LZMA level must be within 0-9, got {}", level));

    std::string encoded(lzma_stream_buffer_bound(data.size()), '\0');
    size_t out_pos = 0;

    const lzma_ret ret = lzma_easy_buffer_encode(
        level,
        LZMA_CHECK_CRC32,
        nullptr,
        reinterpret_cast<const uint8_t *>(data.data()),
        data.size(),
        reinterpret_cast<uint8_t *>(encoded.data()),
        &out_pos,
        encoded.size());

    if (ret != LZMA_OK)
        throw CodecError(std::format("LZMA encoding failed with code {}", static_cast<int>(ret)));

    encoded.resize(out_pos);
    return encoded;
}

std::string LzmaCodec::decode(std::string_view data, uint64_t declared_size) const
{
    if (declared_size > std::numeric_limits<size_t>::max())
        throw CodecError(std::format("declared chunk size {} is too large", declared_size));

    std::string decoded(static_cast<size_t>(declared_size), '\0');
    uint64_t memlimit = std::numeric_limits<uint64_t>::max();
    size_t in_pos = 0;
    size_t out_pos = 0;

    const lzma_ret ret = lzma_stream_buffer_decode(
        &memlimit,
        0,
        nullptr,
        reinterpret_cast<const uint8_t *>(data.data()),
        &in_pos,
        data.size(),
        reinterpret_cast<uint8_t *>(decoded.data()),
        &out_pos,
        decoded.size());

    // LZMA_BUF_ERROR means the output buffer was too small, the chunk is bigger than declared
    if (ret != LZMA_OK)
        throw CodecError(std::format("corrupt LZMA chunk, decoder returned code {}", static_cast<int>(ret)));

    if (out_pos != decoded.size() || in_pos != data.size())
        throw CodecError(std::format("LZMA chunk decoded to {} bytes, expected {}", out_pos, declared_size));

    return decoded;
}

const ChunkCodec &codec_for(const std::optional<Compression> &compression)
{
    static const IdentityCodec identity;
    static const LzmaCodec lzma;

    if (!compression)
        return identity;

    switch (compression->type)
    {
    case CompressionType::LZMA:
        return lzma;
    }

    throw CodecError("unknown chunk compression");
}

EncodedChunk encode_chunk(std::string_view data, const std::optional<Compression> &compression)
{
    if (!compression)
        return EncodedChunk{std::string(data), std::nullopt};

    std::string encoded = codec_for(compression).encode(data, compression->level);

    if (encoded.size() >= data.size())
        return EncodedChunk{std::string(data), std::nullopt};

    return EncodedChunk{std::move(encoded), compression};
}

std::string decode_chunk(std::string_view stored, const ChunkDescriptor &descriptor)
{
    try
    {
        return codec_for(descriptor.compression).decode(stored, descriptor.source_size);
    }
    catch (const CodecError &e)
    {
        throw CodecError(std::format("chunk {}: {}", to_hex(descriptor.checksum), e.what()));
    }
}
