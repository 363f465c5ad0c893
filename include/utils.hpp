#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <filesystem>
#include <cstdint>
#include <cmath>

// returns the lowercase hex string of the bytes
std::string to_hex(std::string_view bytes);

// returns the 8 byte big endian encoding of the number
std::string encode_u64(uint64_t n);

// decodes 8 big endian bytes, data must hold at least 8 bytes
uint64_t decode_u64(std::string_view data);

// human readable size like "1.50 MiB"
std::string size_to_string(uint64_t size);

// resolves a path stored in a dictionary relative to the archive location
std::filesystem::path resolve_relative_to(const std::filesystem::path &base_file, const std::string &path);

void print_progress_bar(const std::string &message, double progress, size_t bar_width = 30);
