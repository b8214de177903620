#pragma once
#include <certreq/api/types.hpp>
#include <certreq/crypto/pointers.hpp>

namespace certreq::crypto
{
class CryptoContext;
} // namespace certreq::crypto

namespace certreq::request
{

/// @brief Generates the private key a certificate spec asks for.
class KeyGenerator final
{
public:
    explicit KeyGenerator(const crypto::CryptoContext& ctx);

    /// @throws CryptoException with Errc::UnsupportedAlgorithm for a size or
    /// algorithm outside the supported set, Errc::GenerationFailure if
    /// OpenSSL fails to produce the key.
    crypto::KeyPtr generate(const api::CertificateSpec& spec) const;

private:
    const crypto::CryptoContext& ctx_;
};

} // namespace certreq::request
