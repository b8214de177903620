#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <certreq/api/types.hpp>

namespace certreq::crypto
{
class CryptoContext;
} // namespace certreq::crypto

namespace certreq::request
{

/// @brief Computes the content-derived identifier of a certificate's request.
///
/// The identifier is `<prefix>-<hex>`: the certificate name cut to
/// #kMaxPrefixLength characters without trailing '-' or '.', then the first
/// #kDigestPrefixLength bytes of the SHA-256 of #canonicalize() in hex.
///
/// Metadata (name, namespace, labels, annotations), secretName and
/// renewBefore do not take part in the digest.
class RequestNamer final
{
public:
    static constexpr size_t kMaxPrefixLength{52};
    static constexpr size_t kDigestPrefixLength{5};

    explicit RequestNamer(const crypto::CryptoContext& ctx);

    /// @brief Tagged, length-prefixed encoding of the issuance-relevant fields.
    static std::vector<uint8_t> canonicalize(const api::CertificateSpec& spec);

    /// @throws CryptoException with Errc::InvalidSpec for an empty
    /// certificate name, Errc::HashingFailure if the digest fails.
    std::string computeName(const api::Certificate& crt) const;

private:
    const crypto::CryptoContext& ctx_;
};

} // namespace certreq::request
