#include <string>

#include <certreq/request/key_parameters.hpp>
#include <certreq/crypto/exception.hpp>

using namespace certreq::crypto;

namespace certreq::request
{

namespace
{

[[noreturn]] void unsupported(const api::CertificateSpec& spec)
{
    throw CryptoException(make_error_code(Errc::UnsupportedAlgorithm),
                          "unsupported " + std::string(api::toString(spec.keyAlgorithm)) + " key size " +
                              std::to_string(spec.keySize));
}

} // namespace

KeyParameters keyParameters(const api::CertificateSpec& spec)
{
    switch (spec.keyAlgorithm)
    {
    case api::KeyAlgorithm::RSA:
    {
        if (spec.keySize < kMinRSAKeySize || spec.keySize > kMaxRSAKeySize)
        {
            unsupported(spec);
        }

        auto alg = SignatureAlgorithm::SHA256WithRSA;
        if (spec.keySize >= 4096)
        {
            alg = SignatureAlgorithm::SHA512WithRSA;
        }
        else if (spec.keySize >= 3072)
        {
            alg = SignatureAlgorithm::SHA384WithRSA;
        }
        return {api::KeyAlgorithm::RSA, spec.keySize, {}, alg};
    }

    case api::KeyAlgorithm::ECDSA:
        switch (spec.keySize)
        {
        case 256:
            return {api::KeyAlgorithm::ECDSA, 256, "prime256v1", SignatureAlgorithm::ECDSAWithSHA256};
        case 384:
            return {api::KeyAlgorithm::ECDSA, 384, "secp384r1", SignatureAlgorithm::ECDSAWithSHA384};
        case 521:
            return {api::KeyAlgorithm::ECDSA, 521, "secp521r1", SignatureAlgorithm::ECDSAWithSHA512};
        default:
            unsupported(spec);
        }
    }

    throw CryptoException(make_error_code(Errc::UnsupportedAlgorithm), "unsupported key algorithm");
}

} // namespace certreq::request
