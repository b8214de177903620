#include <certreq/request/csr_signer.hpp>
#include <certreq/crypto/asymm_key.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/crypto/pem.hpp>
#include <certreq/crypto/req.hpp>

using namespace certreq::crypto;

namespace certreq::request
{

CsrSigner::CsrSigner(const CryptoContext& ctx)
    : ctx_(ctx)
{
}

SignedCsr CsrSigner::sign(CsrTemplate& csr, Key* key) const
{
    ThrowIfTrue(csr.request == nullptr, Errc::InvalidSpec, "empty request template");
    ThrowIfTrue(key == nullptr, Errc::IncompatibleKeyAlgorithm, "no signing key");

    auto keyType = keyTypeName(csr.signatureAlgorithm);
    if (!AsymmKey::isAlgorithm(key, keyType))
    {
        throw CryptoException(make_error_code(Errc::IncompatibleKeyAlgorithm),
                              std::string(toString(csr.signatureAlgorithm)) + " requires a " +
                                  std::string(keyType) + " key");
    }

    try
    {
        Req::setPublicKey(csr.request, key);
        Req::sign(csr.request, key, std::string(digestName(csr.signatureAlgorithm)).c_str(), ctx_);
    }
    catch (const CryptoException& e)
    {
        throw CryptoException(make_error_code(Errc::GenerationFailure), std::string("signing failed: ") + e.what());
    }

    checkConsistency(csr.request, key);

    SignedCsr result;
    result.der = Req::toDer(csr.request);
    result.pem = Pem::encode(kCertificateRequestLabel, result.der);
    return result;
}

void CsrSigner::checkConsistency(X509Req* req, Key* key) const
{
    auto embedded = Req::publicKey(req);
    ThrowIfTrue(embedded == nullptr, Errc::KeyMismatch, "request carries no public key");
    ThrowIfFalse(AsymmKey::isEqual(embedded, key), Errc::KeyMismatch,
                 "request public key does not match the signing key");
    ThrowIfFalse(Req::verify(req, key, ctx_), Errc::KeyMismatch, "request signature does not verify");
}

} // namespace certreq::request
