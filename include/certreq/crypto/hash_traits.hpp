#pragma once
#include <cstdint>
#include <span>
#include <vector>
#include <openssl/evp.h>
#include <certreq/crypto/pointers.hpp>
#include <certreq/crypto/exception.hpp>

namespace certreq::crypto
{

class HashTraits
{
public:
    static inline size_t getSize(const Hash* hash) noexcept
    {
        return EVP_MD_get_size(hash);
    }

    static inline HashCtxPtr createContext()
    {
        auto ctx = HashCtxPtr{EVP_MD_CTX_new()};
        ThrowIfTrue(ctx == nullptr, "bad alloc");
        return ctx;
    }

    static inline void initHash(HashCtx* ctx, const Hash* algorithm)
    {
        ThrowIfFalse(0 < EVP_DigestInit_ex(ctx, algorithm, nullptr));
    }

    static inline void updateHash(HashCtx* ctx, std::span<const uint8_t> message)
    {
        ThrowIfFalse(0 < EVP_DigestUpdate(ctx, message.data(), message.size()));
    }

    static inline std::span<uint8_t> finalHash(HashCtx* ctx, std::span<uint8_t> buffer)
    {
        ThrowIfTrue(buffer.size() < static_cast<size_t>(EVP_MD_CTX_get_size(ctx)), "buffer too small");
        unsigned int digestSize = static_cast<unsigned int>(buffer.size());
        ThrowIfFalse(0 < EVP_DigestFinal_ex(ctx, buffer.data(), &digestSize));
        return {buffer.data(), digestSize};
    }

    /// @brief One-shot digest of @p message.
    static inline std::vector<uint8_t> digest(const Hash* algorithm, std::span<const uint8_t> message)
    {
        auto ctx = createContext();
        initHash(ctx, algorithm);
        updateHash(ctx, message);

        std::vector<uint8_t> result(getSize(algorithm));
        auto view = finalHash(ctx, result);
        result.resize(view.size());
        return result;
    }
};

} // namespace certreq::crypto
