#pragma once
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <certreq/api/manifest.hpp>
#include <certreq/config/config_parser.hpp>

namespace certreq::api
{

/// @brief Registry of the manifest versions a caller accepts.
///
/// A scheme is an ordinary value: callers build one (usually with
/// #defaultScheme()) and pass it where documents are decoded.
class Scheme final
{
public:
    using Decoder = std::function<CertificateManifest(const config::ConfigParser&)>;

public:
    Scheme() = default;

    /// @brief Registers @p decoder for @p apiVersion, replacing any previous one.
    void addVersion(std::string apiVersion, Decoder decoder);

    bool recognizes(std::string_view apiVersion) const;

    std::vector<std::string> versions() const;

    /// @brief Decodes a document by the apiVersion of its [manifest] section.
    ///
    /// @throws CryptoException with Errc::InvalidSpec if the version is not
    /// registered, the kind is not Certificate, or a value is malformed.
    CertificateManifest decode(const config::ConfigParser& document) const;

    /// @brief Scheme with cert-manager.io/v1alpha2 and cert-manager.io/v1 registered.
    static Scheme defaultScheme();

private:
    std::map<std::string, Decoder, std::less<>> decoders_;
};

CertificateManifest decodeV1Alpha2(const config::ConfigParser& document);

CertificateManifest decodeV1(const config::ConfigParser& document);

} // namespace certreq::api
