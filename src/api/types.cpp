#include <array>
#include <utility>

#include <certreq/api/types.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/utils/string.hpp>

namespace certreq::api
{

namespace
{

constexpr std::array<std::pair<KeyUsage, std::string_view>, 23> kUsageNames{{
    {KeyUsage::Signing, "signing"},
    {KeyUsage::DigitalSignature, "digital signature"},
    {KeyUsage::ContentCommitment, "content commitment"},
    {KeyUsage::KeyEncipherment, "key encipherment"},
    {KeyUsage::KeyAgreement, "key agreement"},
    {KeyUsage::DataEncipherment, "data encipherment"},
    {KeyUsage::CertSign, "cert sign"},
    {KeyUsage::CRLSign, "crl sign"},
    {KeyUsage::EncipherOnly, "encipher only"},
    {KeyUsage::DecipherOnly, "decipher only"},
    {KeyUsage::Any, "any"},
    {KeyUsage::ServerAuth, "server auth"},
    {KeyUsage::ClientAuth, "client auth"},
    {KeyUsage::CodeSigning, "code signing"},
    {KeyUsage::EmailProtection, "email protection"},
    {KeyUsage::SMIME, "s/mime"},
    {KeyUsage::IPsecEndSystem, "ipsec end system"},
    {KeyUsage::IPsecTunnel, "ipsec tunnel"},
    {KeyUsage::IPsecUser, "ipsec user"},
    {KeyUsage::Timestamping, "timestamping"},
    {KeyUsage::OCSPSigning, "ocsp signing"},
    {KeyUsage::MicrosoftSGC, "microsoft sgc"},
    {KeyUsage::NetscapeSGC, "netscape sgc"},
}};

[[noreturn]] void fail(Errc code, const std::string& message)
{
    throw crypto::CryptoException(make_error_code(code), message);
}

} // namespace

std::string_view toString(KeyUsage usage)
{
    for (const auto& [value, name] : kUsageNames)
    {
        if (value == usage)
        {
            return name;
        }
    }
    return "unknown";
}

KeyUsage keyUsageFromString(std::string_view name)
{
    for (const auto& [value, text] : kUsageNames)
    {
        if (utils::iequals(text, name))
        {
            return value;
        }
    }
    fail(Errc::InvalidSpec, "unknown key usage '" + std::string(name) + "'");
}

std::string_view toString(KeyAlgorithm algorithm)
{
    switch (algorithm)
    {
    case KeyAlgorithm::RSA:
        return "rsa";
    case KeyAlgorithm::ECDSA:
        return "ecdsa";
    }
    return "unknown";
}

KeyAlgorithm keyAlgorithmFromString(std::string_view name)
{
    if (name.empty() || utils::iequals(name, "rsa"))
    {
        return KeyAlgorithm::RSA;
    }
    if (utils::iequals(name, "ecdsa"))
    {
        return KeyAlgorithm::ECDSA;
    }
    fail(Errc::UnsupportedAlgorithm, "unsupported key algorithm '" + std::string(name) + "'");
}

std::string_view toString(KeyEncoding encoding)
{
    switch (encoding)
    {
    case KeyEncoding::PKCS1:
        return "pkcs1";
    case KeyEncoding::PKCS8:
        return "pkcs8";
    }
    return "unknown";
}

KeyEncoding keyEncodingFromString(std::string_view name)
{
    if (name.empty() || utils::iequals(name, "pkcs1"))
    {
        return KeyEncoding::PKCS1;
    }
    if (utils::iequals(name, "pkcs8"))
    {
        return KeyEncoding::PKCS8;
    }
    fail(Errc::UnsupportedEncoding, "unsupported key encoding '" + std::string(name) + "'");
}

int defaultKeySize(KeyAlgorithm algorithm)
{
    return algorithm == KeyAlgorithm::ECDSA ? 256 : 2048;
}

} // namespace certreq::api
