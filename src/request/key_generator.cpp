#include <certreq/request/key_generator.hpp>
#include <certreq/request/key_parameters.hpp>
#include <certreq/crypto/asymm_keygen.hpp>
#include <certreq/crypto/exception.hpp>

namespace certreq::request
{

KeyGenerator::KeyGenerator(const crypto::CryptoContext& ctx)
    : ctx_(ctx)
{
}

crypto::KeyPtr KeyGenerator::generate(const api::CertificateSpec& spec) const
{
    auto params = keyParameters(spec);

    try
    {
        if (params.algorithm == api::KeyAlgorithm::ECDSA)
        {
            return crypto::akey::ec::generate(ctx_, params.curve);
        }
        return crypto::akey::rsa::generate(ctx_, static_cast<size_t>(params.size));
    }
    catch (const crypto::CryptoException& e)
    {
        throw crypto::CryptoException(make_error_code(Errc::GenerationFailure),
                                      std::string("key generation failed: ") + e.what());
    }
}

} // namespace certreq::request
