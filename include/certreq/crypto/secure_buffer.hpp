#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include <openssl/crypto.h>

namespace certreq::crypto
{

/// @brief Move-only byte buffer whose contents are cleansed on destruction.
class SecureBuffer final
{
public:
    SecureBuffer() = default;

    explicit SecureBuffer(std::span<const uint8_t> data)
        : data_(data.begin(), data.end())
    {
    }

    ~SecureBuffer() noexcept
    {
        clear();
    }

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept
        : data_(std::move(other.data_))
    {
        other.data_.clear();
    }

    SecureBuffer& operator=(SecureBuffer&& other) noexcept
    {
        if (this != &other)
        {
            clear();
            data_ = std::move(other.data_);
            other.data_.clear();
        }
        return *this;
    }

    void clear() noexcept
    {
        if (!data_.empty())
        {
            OPENSSL_cleanse(data_.data(), data_.size());
            data_.clear();
        }
    }

    bool empty() const noexcept
    {
        return data_.empty();
    }

    size_t size() const noexcept
    {
        return data_.size();
    }

    std::span<const uint8_t> data() const noexcept
    {
        return data_;
    }

    std::string_view view() const noexcept
    {
        return std::string_view(reinterpret_cast<const char*>(data_.data()), data_.size());
    }

private:
    std::vector<uint8_t> data_;
};

} // namespace certreq::crypto
