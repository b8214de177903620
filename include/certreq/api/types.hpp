#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <certreq/crypto/typedefs.hpp>

namespace certreq::api
{

inline constexpr std::string_view kGroupName{"cert-manager.io"};

/// @brief Annotation naming the Secret the private key is stored in.
inline constexpr std::string_view kPrivateKeySecretNameAnnotation{"cert-manager.io/private-key-secret-name"};

/// @brief Annotation naming the Certificate a request was created for.
inline constexpr std::string_view kCertificateNameAnnotation{"cert-manager.io/certificate-name"};

enum class KeyAlgorithm
{
    RSA,
    ECDSA,
};

using crypto::KeyEncoding;

enum class KeyUsage
{
    Signing,
    DigitalSignature,
    ContentCommitment,
    KeyEncipherment,
    KeyAgreement,
    DataEncipherment,
    CertSign,
    CRLSign,
    EncipherOnly,
    DecipherOnly,
    Any,
    ServerAuth,
    ClientAuth,
    CodeSigning,
    EmailProtection,
    SMIME,
    IPsecEndSystem,
    IPsecTunnel,
    IPsecUser,
    Timestamping,
    OCSPSigning,
    MicrosoftSGC,
    NetscapeSGC,
};

using StringMap = std::map<std::string, std::string>;

struct ObjectMeta
{
    std::string name;
    std::string nameSpace;
    std::string generateName;
    StringMap labels;
    StringMap annotations;
};

struct ObjectReference
{
    std::string name;
    std::string kind;
    std::string group;
};

struct X509Subject
{
    std::vector<std::string> organizations;
    std::vector<std::string> countries;
    std::vector<std::string> organizationalUnits;
    std::vector<std::string> localities;
    std::vector<std::string> provinces;
    std::vector<std::string> streetAddresses;
    std::vector<std::string> postalCodes;
    std::string serialNumber;
};

/// @brief Desired state of a certificate.
///
/// A zero @c duration means the issuer default. @c keySize is explicit here;
/// manifest conversion fills in the algorithm default.
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
    KeyAlgorithm keyAlgorithm{KeyAlgorithm::RSA};
    int keySize{0};
    KeyEncoding keyEncoding{KeyEncoding::PKCS1};
};

struct Certificate
{
    ObjectMeta metadata;
    CertificateSpec spec;
};

struct CertificateRequestSpec
{
    std::chrono::seconds duration{0};
    ObjectReference issuerRef;
    std::string csrPEM;
    bool isCA{false};
    std::vector<KeyUsage> usages;
};

/// @brief One-time issuance request derived from a Certificate.
///
/// @c identifier is the content-derived name; @c metadata.generateName is
/// the seed a server would use when it allocates the final name.
struct CertificateRequest
{
    ObjectMeta metadata;
    std::string identifier;
    CertificateRequestSpec spec;
};

/// @brief Canonical text of @p usage ("digital signature", "server auth", ...).
std::string_view toString(KeyUsage usage);

/// @throws CryptoException with Errc::InvalidSpec for an unknown name.
KeyUsage keyUsageFromString(std::string_view name);

std::string_view toString(KeyAlgorithm algorithm);

/// @brief Parses `rsa` or `ecdsa` (any case); empty text means RSA.
///
/// @throws CryptoException with Errc::UnsupportedAlgorithm otherwise.
KeyAlgorithm keyAlgorithmFromString(std::string_view name);

std::string_view toString(KeyEncoding encoding);

/// @brief Parses `pkcs1` or `pkcs8` (any case); empty text means PKCS1.
///
/// @throws CryptoException with Errc::UnsupportedEncoding otherwise.
KeyEncoding keyEncodingFromString(std::string_view name);

/// @brief Default key size of @p algorithm: 2048 for RSA, 256 for ECDSA.
int defaultKeySize(KeyAlgorithm algorithm);

} // namespace certreq::api
