#include <limits>

#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <certreq/crypto/req.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/crypto/hash_traits.hpp>

namespace certreq::crypto
{

long Req::version(const X509Req* req)
{
    return X509_REQ_get_version(req);
}

X509NamePtr Req::subjectName(const X509Req* req)
{
    X509NamePtr name(X509_NAME_dup(X509_REQ_get_subject_name(req)));
    ThrowIfTrue(name == nullptr);
    return name;
}

std::string Req::commonName(const X509Req* req)
{
    auto name = X509_REQ_get_subject_name(req);
    auto loc = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
    if (loc < 0)
    {
        return std::string();
    }

    auto value = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, loc));

    unsigned char* utf8{nullptr};
    int length = ASN1_STRING_to_UTF8(&utf8, value);
    ThrowIfTrue(length < 0);

    std::string result(reinterpret_cast<char*>(utf8), length);
    OPENSSL_free(utf8);
    return result;
}

KeyPtr Req::publicKey(X509Req* req)
{
    return KeyPtr(X509_REQ_get_pubkey(req));
}

CertExtOwningStackPtr Req::extensions(X509Req* req)
{
    CertExtOwningStackPtr exts(X509_REQ_get_extensions(req));
    if (!exts)
    {
        exts.reset(sk_X509_EXTENSION_new_null());
        ThrowIfTrue(exts == nullptr);
    }
    return exts;
}

X509ExtPtr Req::findExtension(X509Req* req, int nid)
{
    auto exts = extensions(req);
    for (int i = 0; i < sk_X509_EXTENSION_num(exts); ++i)
    {
        auto ext = sk_X509_EXTENSION_value(exts, i);
        if (OBJ_obj2nid(X509_EXTENSION_get_object(ext)) == nid)
        {
            X509ExtPtr copy(X509_EXTENSION_dup(ext));
            ThrowIfTrue(copy == nullptr);
            return copy;
        }
    }
    return nullptr;
}

std::vector<std::string> Req::dnsNames(X509Req* req)
{
    std::vector<std::string> result;

    auto exts = extensions(req);
    GeneralNamesPtr names(
        static_cast<GENERAL_NAMES*>(X509V3_get_d2i(exts, NID_subject_alt_name, nullptr, nullptr)));
    if (!names)
    {
        return result;
    }

    for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i)
    {
        auto name = sk_GENERAL_NAME_value(names, i);
        if (name->type == GEN_DNS)
        {
            auto value = name->d.dNSName;
            result.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(value)),
                                ASN1_STRING_length(value));
        }
    }
    return result;
}

void Req::setPublicKey(X509Req* req, Key* key)
{
    ThrowIfFalse(X509_REQ_set_pubkey(req, key));
}

void Req::sign(X509Req* req, Key* key, const char* digestName, const CryptoContext& ctx)
{
    auto mdCtx = HashTraits::createContext();
    ThrowIfFalse(0 < EVP_DigestSignInit_ex(mdCtx, nullptr, digestName, ctx.libContext(), ctx.propertyQuery(), key,
                                           nullptr));
    ThrowIfFalse(0 < X509_REQ_sign_ctx(req, mdCtx));
}

bool Req::verify(X509Req* req, Key* key, const CryptoContext& ctx)
{
    return 0 < X509_REQ_verify_ex(req, key, ctx.libContext(), ctx.propertyQuery());
}

std::vector<uint8_t> Req::toDer(X509Req* req)
{
    int length = i2d_X509_REQ(req, nullptr);
    ThrowIfFalse(length > 0);

    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* p = der.data();
    ThrowIfFalse(length == i2d_X509_REQ(req, &p));
    return der;
}

X509ReqPtr Req::fromDer(std::span<const uint8_t> der, const CryptoContext& ctx)
{
    ThrowIfTrue(der.size() > static_cast<size_t>(std::numeric_limits<long>::max()), "request too large");

    X509ReqPtr req(X509_REQ_new_ex(ctx.libContext(), ctx.propertyQuery()));
    ThrowIfTrue(req == nullptr);

    X509_REQ* target = req.get();
    const unsigned char* p = der.data();
    ThrowIfTrue(d2i_X509_REQ(&target, &p, static_cast<long>(der.size())) == nullptr, "failed to parse request");
    return req;
}

} // namespace certreq::crypto
