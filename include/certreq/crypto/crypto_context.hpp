#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <certreq/crypto/pointers.hpp>
#include <certreq/utils/noncopyable.hpp>

namespace certreq::crypto
{

/// @brief OpenSSL library context that all key generation, signing and
/// hashing of one caller runs in.
///
/// A context is passed explicitly to every component that consumes
/// randomness or fetches algorithms. The default-constructed context uses
/// the process-wide OpenSSL default context; #isolated() creates a private
/// library context with its own provider set and DRBG tree.
///
class CryptoContext final : utils::NonCopyable
{
public:
    CryptoContext();

    /// @brief Takes ownership of @p libctx; @p propq is the property query
    /// used for every fetch.
    CryptoContext(LibContextPtr libctx, std::string propq);

    ~CryptoContext() noexcept;

    static std::unique_ptr<CryptoContext> isolated(std::string propq = {});

    LibContext* libContext() const noexcept;

    /// @brief Property query string, or nullptr when none was given.
    const char* propertyQuery() const noexcept;

    HashPtr fetchDigest(std::string_view algorithm) const;

    KeyCtxPtr createKeyContext(std::string_view algorithm) const;

    KeyCtxPtr createKeyContext(Key* key) const;

private:
    LibContextPtr libctx_;
    std::string propq_;
};

} // namespace certreq::crypto
