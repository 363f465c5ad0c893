#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <openssl/evp.h>

// strong content hash used for chunk identity and whole file verification
class ChunkHasher
{
public:
    virtual ~ChunkHasher() = default;

    virtual void update(std::string_view data) = 0;

    // returns the digest and resets the hasher for the next input
    virtual std::string finalize() = 0;
    virtual void reset() = 0;
};

class Blake2bHasher : public ChunkHasher
{
public:
    Blake2bHasher();

    void update(std::string_view data) override;
    std::string finalize() override;
    void reset() override;

    // one shot digest truncated to hash_length bytes
    static std::string checksum(std::string_view data, size_t hash_length);

private:
    struct ContextDeleter
    {
        void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
    };

    std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx;
};
