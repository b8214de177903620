#pragma once
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

#include <certreq/utils/exception.hpp>

namespace certreq::utils
{

/// @brief Byte extraction
///
/// @param[in] byte_num which byte to extract, 0 == highest byte
/// @param[in] input the value to extract from
///
/// @return byte byte_num of input
///
template <typename T>
inline constexpr uint8_t get_byte_var(size_t byte_num, T input)
{
    return static_cast<uint8_t>(input >> (((~byte_num) & (sizeof(T) - 1)) << 3));
}

/// @brief Appends tagged, length-prefixed fields to a growing buffer.
///
/// Every field is written as `tag (1 byte) | length (4 bytes, big-endian) | value`,
/// so two different field sequences never produce the same byte stream.
///
class DataWriter final
{
public:
    DataWriter() = default;

    void append(uint8_t tag, std::span<const uint8_t> value)
    {
        ThrowIfTrue(value.size() > std::numeric_limits<uint32_t>::max(), "DataWriter: value too large");

        const auto length = static_cast<uint32_t>(value.size());

        buffer_.push_back(tag);
        for (size_t i = 0; i != sizeof(length); ++i)
        {
            buffer_.push_back(get_byte_var(i, length));
        }
        buffer_.insert(buffer_.end(), value.begin(), value.end());
    }

    void append(uint8_t tag, std::string_view value)
    {
        append(tag, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size()));
    }

    void append(uint8_t tag, uint64_t value)
    {
        uint8_t bytes[sizeof(value)];
        for (size_t i = 0; i != sizeof(value); ++i)
        {
            bytes[i] = get_byte_var(i, value);
        }
        append(tag, std::span<const uint8_t>(bytes, sizeof(bytes)));
    }

    void append(uint8_t tag, bool value)
    {
        const uint8_t byte = value ? 0x01 : 0x00;
        append(tag, std::span<const uint8_t>(&byte, 1));
    }

    std::span<const uint8_t> data() const noexcept
    {
        return buffer_;
    }

    size_t size() const noexcept
    {
        return buffer_.size();
    }

private:
    std::vector<uint8_t> buffer_;
};

} // namespace certreq::utils
