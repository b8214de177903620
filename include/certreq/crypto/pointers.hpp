#pragma once

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <certreq/crypto/typedefs.hpp>
#include <certreq/utils/custom_unique_ptr.hpp>

namespace certreq::crypto
{

struct CertExtOwningStackDeleter
{
    void operator()(CertExtStack* stack) const noexcept
    {
        sk_X509_EXTENSION_pop_free(stack, X509_EXTENSION_free);
    }
};

CERTREQ_DEFINE_UNIQUE_PTR(Asn1OctetStringPtr, Asn1OctetString, ASN1_OCTET_STRING_free);
CERTREQ_DEFINE_UNIQUE_PTR(Asn1StringPtr, Asn1String, ASN1_STRING_free);
CERTREQ_DEFINE_UNIQUE_PTR(BioPtr, Bio, BIO_free_all);

CERTREQ_DEFINE_UNIQUE_PTR(X509ReqPtr, X509Req, X509_REQ_free);
CERTREQ_DEFINE_UNIQUE_PTR(X509ExtPtr, X509Ext, X509_EXTENSION_free);
CERTREQ_DEFINE_UNIQUE_PTR(X509NamePtr, X509Name, X509_NAME_free);
CERTREQ_DEFINE_UNIQUE_PTR(GeneralNamePtr, GeneralName, GENERAL_NAME_free);
CERTREQ_DEFINE_UNIQUE_PTR(GeneralNamesPtr, GeneralNames, GENERAL_NAMES_free);

CERTREQ_DEFINE_UNIQUE_PTR(KeyPtr, Key, EVP_PKEY_free);
CERTREQ_DEFINE_UNIQUE_PTR(KeyCtxPtr, KeyCtx, EVP_PKEY_CTX_free);
CERTREQ_DEFINE_UNIQUE_PTR(HashPtr, Hash, EVP_MD_free);
CERTREQ_DEFINE_UNIQUE_PTR(HashCtxPtr, HashCtx, EVP_MD_CTX_free);
CERTREQ_DEFINE_UNIQUE_PTR(LibContextPtr, LibContext, OSSL_LIB_CTX_free);
CERTREQ_DEFINE_UNIQUE_PTR(Pkcs8InfoPtr, Pkcs8Info, PKCS8_PRIV_KEY_INFO_free);

CERTREQ_DEFINE_UNIQUE_PTR_WITH_DELETER(CertExtOwningStackPtr, CertExtStack, CertExtOwningStackDeleter);

} // namespace certreq::crypto
