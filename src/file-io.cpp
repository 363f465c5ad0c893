#include <algorithm>
#include <format>
#include "../include/file-io.hpp"
#include "../include/errors.hpp"

FileIO::FileIO(const std::string &filepath, std::ios::openmode mode)
{
    open_file(filepath, mode);
}

void FileIO::open_file(const std::string &filepath, std::ios::openmode mode)
{
    this->filepath = filepath;

    fstream.open(filepath, mode | std::ios::binary);

    if (!fstream)
        throw IoError(std::format("failed to open file {}", filepath));
}

void FileIO::close_file()
{
    if (fstream.is_open())
        fstream.close();
}

std::string FileIO::read_file_from_offset(const uint64_t offset, const size_t chunk_size)
{
    if (!(fstream.is_open()))
        throw IoError(std::format("file {} need to be opened for reading!", filepath));

    // a previous short read leaves eof set
    fstream.clear();

    // never allocate past the end of the file
    const uintmax_t file_size = get_file_size();
    if (offset >= file_size)
        return {};

    const size_t read_size = static_cast<size_t>(std::min<uintmax_t>(chunk_size, file_size - offset));

    std::string chunk_string(read_size, '\0');

    // point to the required offset
    fstream.seekg(static_cast<std::streamoff>(offset));

    // read from that offset specific chunk size
    fstream.read(chunk_string.data(), static_cast<std::streamsize>(read_size));

    if (fstream.bad())
        throw IoError(std::format("failed to read {} bytes at offset {} from {}", read_size, offset, filepath));

    chunk_string.resize(static_cast<size_t>(fstream.gcount()));
    fstream.clear();

    return chunk_string;
}

// write at a particular offset in a file
void FileIO::write_file_at_offset(const uint64_t offset, const std::string &data)
{
    if (!(fstream.is_open()))
        throw IoError(std::format("file {} need to be opened for writing!", filepath));

    fstream.seekp(static_cast<std::streamoff>(offset));
    fstream.write(data.data(), static_cast<std::streamsize>(data.size()));

    if (!fstream)
        throw IoError(std::format("failed to write {} bytes at offset {} to {}", data.size(), offset, filepath));
}

// write the chunk at last of file
void FileIO::append_chunk(const std::string &data)
{
    if (!(fstream.is_open()))
        throw IoError(std::format("file {} need to be opened for appending!", filepath));

    fstream.write(data.data(), static_cast<std::streamsize>(data.size()));

    if (!fstream)
        throw IoError(std::format("failed to append {} bytes to {}", data.size(), filepath));
}

void FileIO::flush()
{
    fstream.flush();

    if (!fstream)
        throw IoError(std::format("failed to flush {}", filepath));
}

std::string FileIO::get_filepath() const
{
    return this->filepath;
}

uintmax_t FileIO::get_file_size() const
{
    std::error_code ec;
    const uintmax_t size = fs::file_size(filepath, ec);

    if (ec)
        throw IoError(std::format("failed to get size of {}: {}", filepath, ec.message()));

    return size;
}

FileIO::~FileIO()
{
    close_file();
}
