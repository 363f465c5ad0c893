#include <cstring>
#include <format>
#include "../include/archive.hpp"
#include "../include/chunk-hasher.hpp"
#include "../include/errors.hpp"
#include "../include/utils.hpp"

// block size used when copying chunk data into the archive
constexpr size_t COPY_BLOCK_SIZE = 1024 * 1024;

std::string build_archive_header(const ChunkDictionary &dictionary)
{
    const std::string dictionary_data = serialize_dictionary(dictionary);

    std::string header(ARCHIVE_MAGIC, sizeof(ARCHIVE_MAGIC));
    header += encode_u64(dictionary_data.size());
    header += dictionary_data;

    // chunk data starts right after the offset field and the checksum
    const uint64_t chunk_data_offset = header.size() + sizeof(uint64_t) + HEADER_CHECKSUM_LENGTH;
    header += encode_u64(chunk_data_offset);

    header += Blake2bHasher::checksum(header, HEADER_CHECKSUM_LENGTH);

    return header;
}

ArchiveHeader read_archive_header(FileIO &archive)
{
    const uintmax_t file_size = archive.get_file_size();
    const std::string path = archive.get_filepath();

    const std::string prefix = archive.read_file_from_offset(0, sizeof(ARCHIVE_MAGIC) + sizeof(uint64_t));

    if (prefix.size() != sizeof(ARCHIVE_MAGIC) + sizeof(uint64_t) ||
        std::memcmp(prefix.data(), ARCHIVE_MAGIC, sizeof(ARCHIVE_MAGIC)) != 0)
        throw DictionaryInvalidError(std::format("{} is not a chunkvault archive", path));

    const uint64_t dictionary_size = decode_u64(std::string_view(prefix).substr(sizeof(ARCHIVE_MAGIC)));
    const uint64_t header_size = prefix.size() + dictionary_size + sizeof(uint64_t) + HEADER_CHECKSUM_LENGTH;

    if (dictionary_size > file_size || header_size > file_size)
        throw DictionaryInvalidError(std::format("{} is truncated, header needs {} bytes", path, header_size));

    const std::string rest = archive.read_file_from_offset(prefix.size(), static_cast<size_t>(header_size - prefix.size()));
    if (rest.size() != header_size - prefix.size())
        throw DictionaryInvalidError(std::format("{} is truncated", path));

    const std::string covered = prefix + rest.substr(0, rest.size() - HEADER_CHECKSUM_LENGTH);
    const std::string stored_checksum = rest.substr(rest.size() - HEADER_CHECKSUM_LENGTH);

    if (Blake2bHasher::checksum(covered, HEADER_CHECKSUM_LENGTH) != stored_checksum)
        throw DictionaryInvalidError(std::format("header checksum mismatch in {}", path));

    ArchiveHeader header;
    header.dictionary = parse_dictionary(std::string_view(rest).substr(0, static_cast<size_t>(dictionary_size)));
    header.chunk_data_offset = decode_u64(std::string_view(rest).substr(static_cast<size_t>(dictionary_size), sizeof(uint64_t)));

    if (header.chunk_data_offset != header_size)
        throw DictionaryInvalidError(std::format("chunk data offset {} doesn't follow the header in {}", header.chunk_data_offset, path));

    return header;
}

ArchiveHeader read_archive_header(const fs::path &archive_path)
{
    FileIO archive(archive_path.string(), std::ios::in);
    return read_archive_header(archive);
}

void write_archive(const fs::path &output_path, const ChunkDictionary &dictionary, const std::optional<fs::path> &embedded_chunk_file)
{
    FileIO output(output_path.string(), std::ios::out | std::ios::trunc);

    output.append_chunk(build_archive_header(dictionary));

    if (embedded_chunk_file)
    {
        FileIO chunk_file(embedded_chunk_file->string(), std::ios::in);
        const uintmax_t size = chunk_file.get_file_size();

        for (uint64_t offset = 0; offset < size;)
        {
            const std::string block = chunk_file.read_file_from_offset(offset, COPY_BLOCK_SIZE);
            if (block.empty())
                throw IoError(std::format("unexpected end of {} at offset {}", embedded_chunk_file->string(), offset));

            output.append_chunk(block);
            offset += block.size();
        }
    }

    output.flush();
}
