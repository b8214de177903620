#include <openssl/evp.h>
#include <openssl/core_names.h>

#include <certreq/crypto/asymm_keygen.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/exception.hpp>

using namespace certreq;

namespace
{

crypto::KeyPtr generateWithParams(const crypto::CryptoContext& ctx, const char* name, const OSSL_PARAM* params)
{
    EVP_PKEY* pkey{nullptr};
    crypto::KeyCtxPtr keyCtx(ctx.createKeyContext(name));
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(keyCtx));
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_params(keyCtx, params));
    crypto::ThrowIfFalse(0 < EVP_PKEY_generate(keyCtx, &pkey));
    return crypto::KeyPtr{pkey};
}

} // namespace

namespace certreq::crypto::akey
{

namespace rsa
{

KeyPtr generate(const CryptoContext& ctx, size_t bits)
{
    OSSL_PARAM params[] = {OSSL_PARAM_END, OSSL_PARAM_END};

    params[0] = OSSL_PARAM_construct_size_t(OSSL_PKEY_PARAM_RSA_BITS, &bits);

    return ::generateWithParams(ctx, "RSA", params);
}

} // namespace rsa

namespace ec
{

KeyPtr generate(const CryptoContext& ctx, std::string_view groupName)
{
    std::string group(groupName);
    OSSL_PARAM params[] = {OSSL_PARAM_END, OSSL_PARAM_END};

    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group.data(), 0);

    return ::generateWithParams(ctx, "EC", params);
}

} // namespace ec

} // namespace certreq::crypto::akey
