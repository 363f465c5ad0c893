#include <sstream>
#include <algorithm>
#include <iterator>
#include <iomanip>
#include <format>
#include "../include/utils.hpp"

std::string to_hex(std::string_view bytes)
{
    std::ostringstream oss;
    for (unsigned char byte : bytes)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);

    return oss.str();
}

std::string encode_u64(uint64_t n)
{
    std::string encoded(sizeof(uint64_t), '\0');

    // most significant byte first
    for (size_t i = 0; i < sizeof(uint64_t); i++)
        encoded[i] = static_cast<char>((n >> (8 * (sizeof(uint64_t) - 1 - i))) & 0xff);

    return encoded;
}

uint64_t decode_u64(std::string_view data)
{
    uint64_t n = 0;
    for (size_t i = 0; i < sizeof(uint64_t); i++)
        n = (n << 8) | static_cast<unsigned char>(data[i]);

    return n;
}

std::string size_to_string(uint64_t size)
{
    constexpr const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    double value = static_cast<double>(size);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units))
    {
        value /= 1024.0;
        unit++;
    }

    if (unit == 0)
        return std::format("{} B", size);

    return std::format("{:.2f} {}", value, units[unit]);
}

std::filesystem::path resolve_relative_to(const std::filesystem::path &base_file, const std::string &path)
{
    std::filesystem::path stored(path);

    if (stored.is_absolute())
        return stored;

    return base_file.parent_path() / stored;
}

void print_progress_bar(const std::string &message, double progress, size_t bar_width)
{
    progress = std::clamp(progress, 0.0, 1.0);

    size_t filled = static_cast<size_t>(std::round(progress * bar_width));
    size_t empty = bar_width - filled;

    std::stringstream ss;
    for (size_t i = 0; i < filled; i++)
        ss << "\033[35m█\033[0m";
    for (size_t i = 0; i < empty; i++)
        ss << "░";

    std::clog << "\r"
              << message
              << " ["
              << ss.str()
              << "] " << std::fixed << std::setprecision(2)
              << (progress * 100) << "% completed" << std::flush;
}
