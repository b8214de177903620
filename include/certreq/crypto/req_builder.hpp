#pragma once

#include <memory>
#include <string_view>

#include <certreq/crypto/pointers.hpp>
#include <certreq/utils/noncopyable.hpp>

namespace certreq::crypto
{

class CryptoContext;

/// @brief Assembles an unsigned PKCS#10 request: subject name plus the
/// extensionRequest attribute. Public key and signature are added by
/// Req::setPublicKey() and Req::sign().
class ReqBuilder final : utils::NonCopyable
{
public:
    explicit ReqBuilder(const CryptoContext& ctx);

    ~ReqBuilder() noexcept;

    void reset();

    ReqBuilder& setSubjectName(const X509Name* name);

    ReqBuilder& addExtension(X509Ext* ext);

    ReqBuilder& addExtension(int extNid, std::string_view value);

    X509ReqPtr build();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace certreq::crypto
