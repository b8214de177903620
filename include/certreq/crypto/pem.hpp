#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace certreq::crypto
{

/// @brief One decoded PEM block: the label between the BEGIN/END markers
/// and the base64-decoded body.
struct PemBlock
{
    std::string label;
    std::vector<uint8_t> der;
};

class Pem final
{
public:
    /// @brief Wraps @p der in `-----BEGIN <label>-----` / `-----END <label>-----`
    /// with 64-column base64 lines.
    static std::string encode(std::string_view label, std::span<const uint8_t> der);

    /// @brief Decodes the first PEM block of @p text.
    ///
    /// @throws CryptoException when no well-formed block is found.
    static PemBlock decode(std::span<const uint8_t> text);

    static PemBlock decode(std::string_view text);
};

} // namespace certreq::crypto
