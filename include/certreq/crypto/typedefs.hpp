#pragma once
#include <openssl/opensslv.h>
#include <openssl/safestack.h>
#include <openssl/x509v3.h>

namespace certreq::crypto
{

/// @brief Textual private key formats.
enum class KeyEncoding
{
    PKCS1, ///< RSA PRIVATE KEY / EC PRIVATE KEY
    PKCS8, ///< PRIVATE KEY
};

using Asn1Integer = struct asn1_string_st;
using Asn1OctetString = struct asn1_string_st;
using Asn1String = struct asn1_string_st;
using Bio = struct bio_st;
using X509Ext = struct X509_extension_st;
using X509Name = struct X509_name_st;
using GeneralName = struct GENERAL_NAME_st;
using X509V3Ctx = struct v3_ext_ctx;
using X509Req = struct X509_req_st;
using Hash = struct evp_md_st;
using HashCtx = struct evp_md_ctx_st;
using Key = struct evp_pkey_st;
using KeyCtx = struct evp_pkey_ctx_st;
using LibContext = struct ossl_lib_ctx_st;
using Pkcs8Info = struct pkcs8_priv_key_info_st;

using CertExtStack = STACK_OF(X509_EXTENSION);
using GeneralNames = STACK_OF(GENERAL_NAME);

} // namespace certreq::crypto
