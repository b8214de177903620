#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <certreq/crypto/pointers.hpp>

namespace certreq::crypto
{

class CryptoContext;

/// @brief Accessors and operations on PKCS#10 certificate requests.
class Req final
{
public:
    static long version(const X509Req* req);

    static X509NamePtr subjectName(const X509Req* req);

    /// @brief First CN entry of the subject, empty if there is none.
    static std::string commonName(const X509Req* req);

    static KeyPtr publicKey(X509Req* req);

    static CertExtOwningStackPtr extensions(X509Req* req);

    /// @brief Finds the requested extension with @p nid.
    ///
    /// @return The extension, or nullptr if the request does not carry it.
    static X509ExtPtr findExtension(X509Req* req, int nid);

    /// @brief DNS entries of the requested subjectAltName extension.
    static std::vector<std::string> dnsNames(X509Req* req);

    static void setPublicKey(X509Req* req, Key* key);

    /// @brief Signs @p req with @p key using the digest @p digestName.
    static void sign(X509Req* req, Key* key, const char* digestName, const CryptoContext& ctx);

    /// @brief Verifies the self-signature of @p req against @p key.
    static bool verify(X509Req* req, Key* key, const CryptoContext& ctx);

    static std::vector<uint8_t> toDer(X509Req* req);

    static X509ReqPtr fromDer(std::span<const uint8_t> der, const CryptoContext& ctx);
};

} // namespace certreq::crypto
