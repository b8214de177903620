#include <string>

#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <certreq/crypto/req_builder.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/exception.hpp>

namespace certreq::crypto
{

struct ReqBuilder::Impl
{
    const CryptoContext& cryptoCtx;
    X509ReqPtr req;
    X509V3Ctx ctx;
    CertExtOwningStackPtr extensions;

    explicit Impl(const CryptoContext& c)
        : cryptoCtx(c)
    {
        reset();
    }

    void reset()
    {
        req.reset(X509_REQ_new_ex(cryptoCtx.libContext(), cryptoCtx.propertyQuery()));
        crypto::ThrowIfTrue(req == nullptr);
        crypto::ThrowIfFalse(X509_REQ_set_version(req, X509_REQ_VERSION_1));

        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, nullptr, nullptr, req, nullptr, 0);

        extensions.reset(sk_X509_EXTENSION_new_null());
        crypto::ThrowIfTrue(extensions == nullptr);
    }
};

ReqBuilder::ReqBuilder(const CryptoContext& ctx)
    : impl_(std::make_unique<ReqBuilder::Impl>(ctx))
{
}

ReqBuilder::~ReqBuilder() noexcept
{
}

void ReqBuilder::reset()
{
    impl_->reset();
}

ReqBuilder& ReqBuilder::setSubjectName(const X509Name* name)
{
    crypto::ThrowIfFalse(X509_REQ_set_subject_name(impl_->req, name));
    return *this;
}

ReqBuilder& ReqBuilder::addExtension(X509Ext* ext)
{
    X509ExtPtr copy(X509_EXTENSION_dup(ext));
    crypto::ThrowIfTrue(copy == nullptr);
    crypto::ThrowIfFalse(0 < sk_X509_EXTENSION_push(impl_->extensions, copy));
    (void)copy.release();
    return *this;
}

ReqBuilder& ReqBuilder::addExtension(int extNid, std::string_view value)
{
    const std::string conf(value);
    X509ExtPtr ext(X509V3_EXT_conf_nid(nullptr, &impl_->ctx, extNid, conf.c_str()));
    crypto::ThrowIfTrue(ext == nullptr, "invalid extension value '" + conf + "'");
    crypto::ThrowIfFalse(0 < sk_X509_EXTENSION_push(impl_->extensions, ext));
    (void)ext.release();
    return *this;
}

X509ReqPtr ReqBuilder::build()
{
    if (sk_X509_EXTENSION_num(impl_->extensions) > 0)
    {
        crypto::ThrowIfFalse(X509_REQ_add_extensions(impl_->req, impl_->extensions));
    }

    auto result = std::move(impl_->req);
    reset();

    return result;
}

} // namespace certreq::crypto
