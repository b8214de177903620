#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <certreq/api/types.hpp>

namespace certreq::api
{

inline constexpr std::string_view kCertificateKind{"Certificate"};
inline constexpr std::string_view kCertificateRequestKind{"CertificateRequest"};

namespace v1alpha2
{

inline constexpr std::string_view kApiVersion{"cert-manager.io/v1alpha2"};

/// @brief Certificate spec with flat key fields and a top-level organization list.
struct CertificateSpec
{
    std::vector<std::string> organization;
    X509Subject subject;
    std::string commonName;
    std::chrono::seconds duration{0};
    std::chrono::seconds renewBefore{0};
    std::vector<std::string> dnsNames;
    std::vector<std::string> ipAddresses;
    std::vector<std::string> uriSANs;
    std::vector<std::string> emailSANs;
    std::string secretName;
    ObjectReference issuerRef;
    bool isCA{false};
    std::vector<KeyUsage> usages;
    int keySize{0};
    KeyAlgorithm keyAlgorithm{KeyAlgorithm::RSA};
    KeyEncoding keyEncoding{KeyEncoding::PKCS1};
};

struct Certificate
{
    ObjectMeta metadata;
    CertificateSpec spec;
};

} // namespace v1alpha2

namespace v1
{

inline constexpr std::string_view kApiVersion{"cert-manager.io/v1"};

struct PrivateKey
{
    KeyAlgorithm algorithm{KeyAlgorithm::RSA};
    KeyEncoding encoding{KeyEncoding::PKCS1};
    int size{0};
};

/// @brief Certificate spec with key options grouped under privateKey.
struct CertificateSpec
{
    X509Subject subject;
    std::string commonName;
    std::chrono::seconds duration{0};
    std::chrono::seconds renewBefore{0};
    std::vector<std::string> dnsNames;
    std::vector<std::string> ipAddresses;
    std::vector<std::string> uriSANs;
    std::vector<std::string> emailSANs;
    std::string secretName;
    ObjectReference issuerRef;
    bool isCA{false};
    std::vector<KeyUsage> usages;
    PrivateKey privateKey;
};

struct Certificate
{
    ObjectMeta metadata;
    CertificateSpec spec;
};

} // namespace v1

using CertificateManifest = std::variant<v1alpha2::Certificate, v1::Certificate>;

std::string_view apiVersionOf(const CertificateManifest& manifest);

/// @brief Converts a versioned manifest into the internal Certificate.
Certificate toCertificate(const v1alpha2::Certificate& manifest);

Certificate toCertificate(const v1::Certificate& manifest);

Certificate toCertificate(const CertificateManifest& manifest);

} // namespace certreq::api
