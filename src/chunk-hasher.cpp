#include <stdexcept>
#include "../include/chunk-hasher.hpp"

Blake2bHasher::Blake2bHasher() : ctx(EVP_MD_CTX_new())
{
    if (!ctx)
        throw std::runtime_error("failed to allocate digest context");

    reset();
}

void Blake2bHasher::update(std::string_view data)
{
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
        throw std::runtime_error("failed to update BLAKE2b digest");
}

std::string Blake2bHasher::finalize()
{
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1)
        throw std::runtime_error("failed to finalize BLAKE2b digest");

    reset();

    return std::string(reinterpret_cast<const char *>(hash), hash_len);
}

void Blake2bHasher::reset()
{
    if (EVP_DigestInit_ex(ctx.get(), EVP_blake2b512(), nullptr) != 1)
        throw std::runtime_error("failed to initialize BLAKE2b digest");
}

std::string Blake2bHasher::checksum(std::string_view data, size_t hash_length)
{
    Blake2bHasher hasher;
    hasher.update(data);

    std::string digest = hasher.finalize();
    if (hash_length < digest.size())
        digest.resize(hash_length);

    return digest;
}
