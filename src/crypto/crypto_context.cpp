#include <openssl/crypto.h>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/exception.hpp>

namespace certreq::crypto
{

CryptoContext::CryptoContext()
    : libctx_(nullptr)
{
}

CryptoContext::CryptoContext(LibContextPtr libctx, std::string propq)
    : libctx_(std::move(libctx))
    , propq_(std::move(propq))
{
}

CryptoContext::~CryptoContext() noexcept
{
}

std::unique_ptr<CryptoContext> CryptoContext::isolated(std::string propq)
{
    LibContextPtr libctx(OSSL_LIB_CTX_new());
    ThrowIfTrue(libctx == nullptr, "failed to create library context");
    return std::make_unique<CryptoContext>(std::move(libctx), std::move(propq));
}

LibContext* CryptoContext::libContext() const noexcept
{
    return libctx_.get();
}

const char* CryptoContext::propertyQuery() const noexcept
{
    return propq_.empty() ? nullptr : propq_.c_str();
}

HashPtr CryptoContext::fetchDigest(std::string_view algorithm) const
{
    auto digest = HashPtr(EVP_MD_fetch(libContext(), std::string(algorithm).c_str(), propertyQuery()));
    ThrowIfTrue(digest == nullptr);
    return digest;
}

KeyCtxPtr CryptoContext::createKeyContext(std::string_view algorithm) const
{
    auto ctx = KeyCtxPtr(EVP_PKEY_CTX_new_from_name(libContext(), std::string(algorithm).c_str(), propertyQuery()));
    ThrowIfTrue(ctx == nullptr);
    return ctx;
}

KeyCtxPtr CryptoContext::createKeyContext(Key* key) const
{
    auto ctx = KeyCtxPtr(EVP_PKEY_CTX_new_from_pkey(libContext(), key, propertyQuery()));
    ThrowIfTrue(ctx == nullptr);
    return ctx;
}

} // namespace certreq::crypto
