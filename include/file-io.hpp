#pragma once
#include <fstream>
#include <iostream>
#include <filesystem>
#include <string>
#include <cstdint>

namespace fs = std::filesystem;

// binary file handle with offset addressed reads and writes, throws IoError on failure
class FileIO
{
    std::fstream fstream;
    std::string filepath;

public:
    FileIO(const std::string &filepath, const std::ios::openmode mode = std::ios::in);
    void open_file(const std::string &filepath, const std::ios::openmode mode);
    void close_file();

    // may return less than chunk_size bytes when the file ends before
    std::string read_file_from_offset(const uint64_t offset, const size_t chunk_size);
    void write_file_at_offset(const uint64_t offset, const std::string &data);
    void append_chunk(const std::string &data);
    void flush();
    std::string get_filepath() const;
    uintmax_t get_file_size() const;
    ~FileIO();
};
