#include <stdexcept>
#include <bit>
#include "../include/rolling-hash.hpp"

BuzHash::BuzHash(uint32_t window_size, uint32_t seed)
    : window_len(window_size),
      out_rotation(window_size % 32)
{
    if (window_size == 0)
        throw std::invalid_argument("rolling hash window size must be greater than zero");

    // fill the table from a xorshift sequence so the same seed always gives the same boundaries
    uint32_t state = seed ? seed : 1;
    for (auto &entry : table)
    {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        entry = state;
    }

    window.resize(window_size);
}

/*
    hash = rotl(T[b0], w-1) ^ rotl(T[b1], w-2) ^ ... ^ T[bw-1]
    adding byte c:   hash = rotl(hash, 1) ^ T[c]
    dropping byte o: hash ^= rotl(T[o], w)
*/
uint32_t BuzHash::push(uint8_t byte)
{
    hash = std::rotl(hash, 1);

    if (filled == window_len)
    {
        // the oldest byte sits at head, its contribution got rotated w times by now
        hash ^= std::rotl(table[window[head]], static_cast<int>(out_rotation));
    }
    else
        filled++;

    hash ^= table[byte];

    window[head] = byte;
    head = (head + 1) % window_len;

    return hash;
}

uint32_t BuzHash::current_hash() const
{
    return hash;
}

bool BuzHash::valid() const
{
    return filled == window_len;
}

void BuzHash::reset()
{
    head = 0;
    filled = 0;
    hash = 0;
}

uint32_t BuzHash::window_size() const
{
    return window_len;
}
