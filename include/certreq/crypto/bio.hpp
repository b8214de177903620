#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <openssl/bio.h>

#include <certreq/crypto/pointers.hpp>
#include <certreq/crypto/exception.hpp>

namespace certreq::crypto
{

class BioTraits
{
public:
    static inline BioPtr createMemoryBuffer()
    {
        BioPtr result{BIO_new(BIO_s_mem())};
        ThrowIfTrue(result == nullptr);
        return result;
    }

    /// @brief Memory BIO backed by the OpenSSL secure heap, cleansed whenever it grows or is freed.
    static inline BioPtr createSecureMemoryBuffer()
    {
        BioPtr result{BIO_new(BIO_s_secmem())};
        ThrowIfTrue(result == nullptr);
        return result;
    }

    static inline BioPtr createMemoryReader(const uint8_t* data, size_t size)
    {
        constexpr auto limit = static_cast<size_t>(std::numeric_limits<int>::max());
        BioPtr bio{BIO_new_mem_buf(data, static_cast<int>(size > limit ? limit : size))};
        ThrowIfTrue(bio == nullptr);
        return bio;
    }

    static inline std::vector<uint8_t> getMemoryData(Bio* bio)
    {
        char* data{nullptr};
        auto length = BIO_get_mem_data(bio, &data);
        ThrowIfTrue(data == nullptr, "invalid pointer");
        return std::vector<uint8_t>(data, data + length);
    }

    static inline std::string getMemoryDataAsString(Bio* bio)
    {
        char* data{nullptr};
        auto length = BIO_get_mem_data(bio, &data);
        ThrowIfTrue(data == nullptr, "invalid pointer");
        return std::string(data, length);
    }
};

} // namespace certreq::crypto
