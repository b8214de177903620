#include <limits>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <certreq/crypto/key_codec.hpp>
#include <certreq/crypto/asymm_key.hpp>
#include <certreq/crypto/bio.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/crypto/pem.hpp>

using namespace certreq;

namespace
{

crypto::KeyPtr decodeTraditional(const crypto::CryptoContext& ctx, int type, const std::vector<uint8_t>& der)
{
    const unsigned char* p = der.data();
    return crypto::KeyPtr(
        d2i_PrivateKey_ex(type, nullptr, &p, static_cast<long>(der.size()), ctx.libContext(), ctx.propertyQuery()));
}

crypto::KeyPtr decodePkcs8(const crypto::CryptoContext& ctx, const std::vector<uint8_t>& der)
{
    const unsigned char* p = der.data();
    crypto::Pkcs8InfoPtr info(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, static_cast<long>(der.size())));
    if (!info)
    {
        return nullptr;
    }
    return crypto::KeyPtr(EVP_PKCS82PKEY_ex(info, ctx.libContext(), ctx.propertyQuery()));
}

} // namespace

namespace certreq::crypto
{

KeyCodec::KeyCodec(const CryptoContext& ctx)
    : ctx_(ctx)
{
}

SecureBuffer KeyCodec::encode(Key* key, KeyEncoding encoding) const
{
    ThrowIfTrue(key == nullptr, Errc::MalformedKeyData, "no private key to encode");

    auto bio = BioTraits::createSecureMemoryBuffer();
    int ret{0};

    switch (encoding)
    {
    case KeyEncoding::PKCS1:
    {
        ThrowIfFalse(AsymmKey::isAlgorithm(key, "RSA") || AsymmKey::isAlgorithm(key, "EC"),
                     Errc::UnsupportedEncoding, "PKCS1 encoding is only defined for RSA and EC keys");
        ret = PEM_write_bio_PrivateKey_traditional(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
    }
    break;

    case KeyEncoding::PKCS8:
    {
        ret = PEM_write_bio_PKCS8PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
    }
    break;

    default:
        ThrowError(Errc::UnsupportedEncoding, "unknown key encoding");
    }

    ThrowIfFalse(ret > 0, Errc::UnsupportedEncoding, "failed to encode private key");

    char* data{nullptr};
    auto length = BIO_get_mem_data(bio, &data);
    ThrowIfTrue(data == nullptr || length <= 0, Errc::UnsupportedEncoding, "failed to encode private key");

    SecureBuffer result(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data), length));
    OPENSSL_cleanse(data, length);
    return result;
}

KeyPtr KeyCodec::decode(std::span<const uint8_t> data) const
{
    ThrowIfTrue(data.empty(), Errc::MalformedKeyData, "empty private key data");

    PemBlock block;
    try
    {
        block = Pem::decode(data);
    }
    catch (const CryptoException& e)
    {
        ThrowError(Errc::MalformedKeyData, std::string("error decoding private key PEM block: ") + e.what());
    }

    KeyPtr key;
    if (block.label == kPkcs8Label)
    {
        key = ::decodePkcs8(ctx_, block.der);
    }
    else if (block.label == kRsaLabel)
    {
        key = ::decodeTraditional(ctx_, EVP_PKEY_RSA, block.der);
    }
    else if (block.label == kEcLabel)
    {
        key = ::decodeTraditional(ctx_, EVP_PKEY_EC, block.der);
    }
    else
    {
        OPENSSL_cleanse(block.der.data(), block.der.size());
        ThrowError(Errc::MalformedKeyData, "unknown private key type '" + block.label + "'");
    }

    OPENSSL_cleanse(block.der.data(), block.der.size());
    ThrowIfTrue(key == nullptr, Errc::MalformedKeyData, "error parsing " + block.label);

    if (AsymmKey::isAlgorithm(key, "RSA"))
    {
        auto checkCtx = ctx_.createKeyContext(key);
        ThrowIfFalse(0 < EVP_PKEY_check(checkCtx), Errc::MalformedKeyData, "RSA private key failed validation");
    }

    return key;
}

} // namespace certreq::crypto
