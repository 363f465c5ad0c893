#pragma once
#include <array>
#include <cstdint>
#include <vector>

constexpr uint32_t BUZHASH_SEED = 0x10324195;

// hash over the last window_size bytes of a stream, updated one byte at a time
class RollingHash
{
public:
    virtual ~RollingHash() = default;

    // add a byte, dropping the oldest one once the window is full
    virtual uint32_t push(uint8_t byte) = 0;
    virtual uint32_t current_hash() const = 0;

    // true once window_size bytes have been pushed since the last reset
    virtual bool valid() const = 0;
    virtual void reset() = 0;
    virtual uint32_t window_size() const = 0;
};

// cyclic polynomial hash, every byte maps to a random 32 bit value
class BuzHash : public RollingHash
{
public:
    explicit BuzHash(uint32_t window_size, uint32_t seed = BUZHASH_SEED);

    uint32_t push(uint8_t byte) override;
    uint32_t current_hash() const override;
    bool valid() const override;
    void reset() override;
    uint32_t window_size() const override;

private:
    std::array<uint32_t, 256> table;
    std::vector<uint8_t> window;
    uint32_t window_len;
    uint32_t out_rotation;
    size_t head = 0;
    size_t filled = 0;
    uint32_t hash = 0;
};
