#include <algorithm>
#include <cctype>
#include <string_view>
#include <openssl/x509v3.h>

#include <certreq/crypto/extension.hpp>
#include <certreq/crypto/exception.hpp>

using namespace certreq;

namespace
{

void pushName(GENERAL_NAMES* names, int type, crypto::Asn1StringPtr value)
{
    crypto::GeneralNamePtr name(GENERAL_NAME_new());
    crypto::ThrowIfTrue(name == nullptr);
    GENERAL_NAME_set0_value(name, type, value.release());

    crypto::ThrowIfFalse(0 < sk_GENERAL_NAME_push(names, name));
    (void)name.release();
}

bool isAscii(std::string_view value)
{
    return std::all_of(value.begin(), value.end(), [](char ch) { return static_cast<unsigned char>(ch) < 0x80; });
}

/// RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
bool hasScheme(std::string_view uri)
{
    auto colon = uri.find(':');
    if (colon == 0 || colon == std::string_view::npos || !std::isalpha(static_cast<unsigned char>(uri[0])))
    {
        return false;
    }
    return std::all_of(uri.begin(), uri.begin() + colon, [](char ch) {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.';
    });
}

void pushString(GENERAL_NAMES* names, int type, const std::string& value)
{
    crypto::ThrowIfFalse(isAscii(value), Errc::InvalidSpec, "non-ASCII subject alternative name '" + value + "'");
    crypto::ThrowIfTrue(type == GEN_URI && !hasScheme(value), Errc::InvalidSpec,
                        "URI subject alternative name '" + value + "' has no scheme");

    crypto::Asn1StringPtr str(ASN1_IA5STRING_new());
    crypto::ThrowIfTrue(str == nullptr);
    crypto::ThrowIfFalse(0 < ASN1_STRING_set(str, value.data(), static_cast<int>(value.size())));

    pushName(names, type, std::move(str));
}

void pushAddress(GENERAL_NAMES* names, const std::string& value)
{
    crypto::Asn1StringPtr address(a2i_IPADDRESS(value.c_str()));
    crypto::ThrowIfTrue(address == nullptr, Errc::InvalidSpec, "invalid IP address '" + value + "'");

    pushName(names, GEN_IPADD, std::move(address));
}

} // namespace

namespace certreq::crypto
{

X509ExtPtr X509Extension::subjectAltName(const std::vector<std::string>& dnsNames,
                                         const std::vector<std::string>& emailAddresses,
                                         const std::vector<std::string>& ipAddresses,
                                         const std::vector<std::string>& uris, bool critical)
{
    GeneralNamesPtr names(sk_GENERAL_NAME_new_null());
    ThrowIfTrue(names == nullptr);

    for (const auto& dns : dnsNames)
    {
        ::pushString(names, GEN_DNS, dns);
    }
    for (const auto& email : emailAddresses)
    {
        ::pushString(names, GEN_EMAIL, email);
    }
    for (const auto& ip : ipAddresses)
    {
        ::pushAddress(names, ip);
    }
    for (const auto& uri : uris)
    {
        ::pushString(names, GEN_URI, uri);
    }

    X509ExtPtr ext(X509V3_EXT_i2d(NID_subject_alt_name, critical ? 1 : 0, names));
    ThrowIfTrue(ext == nullptr);
    return ext;
}

} // namespace certreq::crypto
