#pragma once
#include <string>
#include <vector>
#include <certreq/crypto/pointers.hpp>

namespace certreq::crypto
{

class X509Extension final
{
public:
    /// @brief Builds a subjectAltName extension.
    ///
    /// Names are written DNS first, then email, IP and URI, each group in
    /// the given order. IP entries must be IPv4 or IPv6 literals; DNS, email
    /// and URI entries must be ASCII, and a URI needs a scheme.
    ///
    /// @throws CryptoException with Errc::InvalidSpec for an entry that cannot be encoded.
    static X509ExtPtr subjectAltName(const std::vector<std::string>& dnsNames,
                                     const std::vector<std::string>& emailAddresses,
                                     const std::vector<std::string>& ipAddresses,
                                     const std::vector<std::string>& uris, bool critical = false);
};

} // namespace certreq::crypto
