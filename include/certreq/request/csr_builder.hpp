#pragma once
#include <string>

#include <certreq/api/types.hpp>
#include <certreq/crypto/pointers.hpp>
#include <certreq/crypto/signature_algorithm.hpp>

namespace certreq::crypto
{
class CryptoContext;
} // namespace certreq::crypto

namespace certreq::request
{

/// @brief Unsigned request plus the algorithm it must be signed with.
struct CsrTemplate
{
    crypto::X509ReqPtr request;
    crypto::SignatureAlgorithm signatureAlgorithm;
};

/// @brief Builds the unsigned PKCS#10 structure for a certificate spec.
///
/// The subject carries O, OU, C, ST, L, street and postalCode entries in
/// that order, then serialNumber and CN. Requested extensions are
/// subjectAltName, keyUsage, extendedKeyUsage and, for a CA,
/// basicConstraints.
class CsrBuilder final
{
public:
    explicit CsrBuilder(const crypto::CryptoContext& ctx);

    /// @throws CryptoException with Errc::InvalidSpec when the certificate spec has no
    /// common name and no SAN, or a subject or SAN value is malformed;
    /// Errc::UnsupportedAlgorithm when no signature algorithm fits the key.
    CsrTemplate build(const api::CertificateSpec& spec) const;

    /// @brief keyUsage extension value for @p spec, empty when no bit is set.
    static std::string keyUsageValue(const api::CertificateSpec& spec);

    /// @brief extendedKeyUsage extension value for @p spec, empty when none is requested.
    static std::string extKeyUsageValue(const api::CertificateSpec& spec);

private:
    const crypto::CryptoContext& ctx_;
};

} // namespace certreq::request
