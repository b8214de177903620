#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <certreq/crypto/pointers.hpp>
#include <certreq/utils/noncopyable.hpp>

namespace certreq::crypto
{

/// @brief Builds a distinguished name one RDN at a time, in insertion order.
class CertNameBuilder final : utils::NonCopyable
{
public:
    CertNameBuilder();

    /// @brief Appends `field=value`; @p field is a short or long attribute name ("O", "commonName").
    ///
    /// @throws CryptoException for an unknown attribute or a value OpenSSL rejects.
    CertNameBuilder& addEntry(std::string_view field, std::string_view value);

    /// @brief Adds one @p field entry per element of @p values, in order.
    CertNameBuilder& addEntries(std::string_view field, const std::vector<std::string>& values);

    size_t entryCount() const;

    /// @brief Returns the accumulated name and starts an empty one.
    X509NamePtr build();

private:
    X509NamePtr name_;
};

} // namespace certreq::crypto
