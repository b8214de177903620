#pragma once
#include <string_view>

namespace certreq::crypto
{

enum class SignatureAlgorithm
{
    SHA256WithRSA,
    SHA384WithRSA,
    SHA512WithRSA,
    ECDSAWithSHA256,
    ECDSAWithSHA384,
    ECDSAWithSHA512,
};

/// @brief OpenSSL digest name used with @p alg ("SHA256", ...).
std::string_view digestName(SignatureAlgorithm alg);

/// @brief OpenSSL key type name @p alg signs with ("RSA" or "EC").
std::string_view keyTypeName(SignatureAlgorithm alg);

std::string_view toString(SignatureAlgorithm alg);

} // namespace certreq::crypto
