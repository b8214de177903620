#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <certreq/request/csr_builder.hpp>

namespace certreq::request
{

inline constexpr std::string_view kCertificateRequestLabel{"CERTIFICATE REQUEST"};

struct SignedCsr
{
    std::vector<uint8_t> der;
    std::string pem;
};

/// @brief Signs request templates and checks the result.
class CsrSigner final
{
public:
    explicit CsrSigner(const crypto::CryptoContext& ctx);

    /// @brief Sets the public key of @p csr from @p key and signs it.
    ///
    /// The signed request is verified against @p key and its embedded public
    /// key compared with @p key before it is encoded.
    ///
    /// @throws CryptoException with Errc::IncompatibleKeyAlgorithm if the key
    /// type does not match the template's signature algorithm,
    /// Errc::KeyMismatch if the signed request is not consistent with @p key.
    SignedCsr sign(CsrTemplate& csr, crypto::Key* key) const;

    /// @brief Checks that @p req verifies under @p key and embeds it.
    ///
    /// @throws CryptoException with Errc::KeyMismatch.
    void checkConsistency(crypto::X509Req* req, crypto::Key* key) const;

private:
    const crypto::CryptoContext& ctx_;
};

} // namespace certreq::request
