#pragma once
#include <string_view>

#include <certreq/api/types.hpp>
#include <certreq/crypto/signature_algorithm.hpp>

namespace certreq::request
{

/// @brief Key type, size and matching signature algorithm of a certificate spec.
struct KeyParameters
{
    api::KeyAlgorithm algorithm;
    int size;
    /// OpenSSL group name, empty for RSA.
    std::string_view curve;
    crypto::SignatureAlgorithm signatureAlgorithm;
};

inline constexpr int kMinRSAKeySize{2048};
inline constexpr int kMaxRSAKeySize{8192};

/// @throws CryptoException with Errc::UnsupportedAlgorithm if the size is
/// not allowed for the algorithm.
KeyParameters keyParameters(const api::CertificateSpec& spec);

} // namespace certreq::request
