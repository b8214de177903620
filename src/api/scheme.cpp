#include <certreq/api/scheme.hpp>
#include <certreq/api/duration.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/utils/exception.hpp>

using namespace certreq::config;

namespace certreq::api
{

namespace
{

[[noreturn]] void invalidDocument(const std::string& message)
{
    throw crypto::CryptoException(make_error_code(Errc::InvalidSpec), message);
}

ObjectMeta decodeMetadata(const ConfigParser& document)
{
    auto section = document.getSectionBody("metadata");

    ObjectMeta meta;
    meta.name = getValue(section, "name");
    meta.nameSpace = getValue(section, "namespace");
    meta.labels = document.getSectionBody("labels");
    meta.annotations = document.getSectionBody("annotations");
    return meta;
}

X509Subject decodeSubject(const ConfigParser::Section& section)
{
    X509Subject subject;
    subject.organizations = getList(section, "organizations");
    subject.countries = getList(section, "countries");
    subject.organizationalUnits = getList(section, "organizationalUnits");
    subject.localities = getList(section, "localities");
    subject.provinces = getList(section, "provinces");
    subject.streetAddresses = getList(section, "streetAddresses");
    subject.postalCodes = getList(section, "postalCodes");
    subject.serialNumber = getValue(section, "serialNumber");
    return subject;
}

template <typename Spec>
void decodeSharedFields(const ConfigParser& document, Spec& spec)
{
    auto section = document.getSectionBody("spec");
    auto issuer = document.getSectionBody("issuerRef");

    spec.subject = decodeSubject(document.getSectionBody("subject"));
    spec.commonName = getValue(section, "commonName");
    spec.duration = parseDuration(getValue(section, "duration"));
    spec.renewBefore = parseDuration(getValue(section, "renewBefore"));
    spec.dnsNames = getList(section, "dnsNames");
    spec.ipAddresses = getList(section, "ipAddresses");
    spec.uriSANs = getList(section, "uriSANs");
    spec.emailSANs = getList(section, "emailSANs");
    spec.secretName = getValue(section, "secretName");
    spec.isCA = getBool(section, "isCA");

    for (const auto& usage : getList(section, "usages"))
    {
        spec.usages.push_back(keyUsageFromString(usage));
    }

    spec.issuerRef.name = getValue(issuer, "name");
    spec.issuerRef.kind = getValue(issuer, "kind");
    spec.issuerRef.group = getValue(issuer, "group");
}

} // namespace

void Scheme::addVersion(std::string apiVersion, Decoder decoder)
{
    decoders_[std::move(apiVersion)] = std::move(decoder);
}

bool Scheme::recognizes(std::string_view apiVersion) const
{
    return decoders_.find(apiVersion) != decoders_.end();
}

std::vector<std::string> Scheme::versions() const
{
    std::vector<std::string> result;
    for (const auto& [version, decoder] : decoders_)
    {
        result.push_back(version);
    }
    return result;
}

CertificateManifest Scheme::decode(const ConfigParser& document) const
{
    auto manifest = document.getSectionBody("manifest");
    auto apiVersion = getValue(manifest, "apiVersion");
    auto kind = getValue(manifest, "kind");

    auto found = decoders_.find(apiVersion);
    if (found == decoders_.end())
    {
        invalidDocument("unsupported apiVersion '" + apiVersion + "'");
    }
    if (kind != kCertificateKind)
    {
        invalidDocument("unsupported kind '" + kind + "', expected Certificate");
    }

    try
    {
        return found->second(document);
    }
    catch (const utils::RuntimeError& e)
    {
        invalidDocument(e.what());
    }
}

Scheme Scheme::defaultScheme()
{
    Scheme scheme;
    scheme.addVersion(std::string(v1alpha2::kApiVersion), decodeV1Alpha2);
    scheme.addVersion(std::string(v1::kApiVersion), decodeV1);
    return scheme;
}

CertificateManifest decodeV1Alpha2(const ConfigParser& document)
{
    v1alpha2::Certificate crt;
    crt.metadata = decodeMetadata(document);
    decodeSharedFields(document, crt.spec);

    auto section = document.getSectionBody("spec");
    crt.spec.organization = getList(section, "organization");
    crt.spec.keyAlgorithm = keyAlgorithmFromString(getValue(section, "keyAlgorithm"));
    crt.spec.keySize = getInt(section, "keySize");
    crt.spec.keyEncoding = keyEncodingFromString(getValue(section, "keyEncoding"));

    return crt;
}

CertificateManifest decodeV1(const ConfigParser& document)
{
    v1::Certificate crt;
    crt.metadata = decodeMetadata(document);
    decodeSharedFields(document, crt.spec);

    auto section = document.getSectionBody("privateKey");
    crt.spec.privateKey.algorithm = keyAlgorithmFromString(getValue(section, "algorithm"));
    crt.spec.privateKey.size = getInt(section, "size");
    crt.spec.privateKey.encoding = keyEncodingFromString(getValue(section, "encoding"));

    return crt;
}

} // namespace certreq::api
