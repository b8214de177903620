#pragma once
#include <cstdint>
#include <span>
#include <string_view>

#include <certreq/crypto/pointers.hpp>
#include <certreq/crypto/secure_buffer.hpp>

namespace certreq::crypto
{

class CryptoContext;

/// @brief Converts private keys to and from their PEM text forms.
///
/// | Encoding | RSA key               | EC key               |
/// |----------|-----------------------|----------------------|
/// | PKCS1    | `RSA PRIVATE KEY`     | `EC PRIVATE KEY`     |
/// | PKCS8    | `PRIVATE KEY`         | `PRIVATE KEY`        |
///
class KeyCodec final
{
public:
    static constexpr std::string_view kPkcs8Label{"PRIVATE KEY"};
    static constexpr std::string_view kRsaLabel{"RSA PRIVATE KEY"};
    static constexpr std::string_view kEcLabel{"EC PRIVATE KEY"};

    explicit KeyCodec(const CryptoContext& ctx);

    /// @throws CryptoException with Errc::UnsupportedEncoding if @p encoding
    /// is not a known value or cannot represent the key type, with
    /// Errc::MalformedKeyData if @p key is null.
    SecureBuffer encode(Key* key, KeyEncoding encoding) const;

    /// @throws CryptoException with Errc::MalformedKeyData.
    KeyPtr decode(std::span<const uint8_t> data) const;

    KeyPtr decode(std::string_view data) const
    {
        return decode(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
    }

private:
    const CryptoContext& ctx_;
};

} // namespace certreq::crypto
