#include <span>

#include <certreq/request/request_namer.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/crypto/hash_traits.hpp>
#include <certreq/utils/data_writer.hpp>
#include <certreq/utils/hexlify.hpp>

using namespace certreq::api;

namespace certreq::request
{

namespace
{

enum Tag : uint8_t
{
    CommonName = 1,
    Organizations,
    Countries,
    OrganizationalUnits,
    Localities,
    Provinces,
    StreetAddresses,
    PostalCodes,
    SerialNumber,
    DNSNames,
    IPAddresses,
    URISANs,
    EmailSANs,
    Duration,
    IssuerName,
    IssuerKind,
    IssuerGroup,
    IsCA,
    Usages,
    KeyAlgorithmTag,
    KeySize,
    KeyEncodingTag,
};

void appendList(utils::DataWriter& writer, uint8_t tag, const std::vector<std::string>& values)
{
    writer.append(tag, static_cast<uint64_t>(values.size()));
    for (const auto& value : values)
    {
        writer.append(tag, std::string_view(value));
    }
}

std::string shortenPrefix(const std::string& name)
{
    auto prefix = name.substr(0, RequestNamer::kMaxPrefixLength);
    while (!prefix.empty() && (prefix.back() == '-' || prefix.back() == '.'))
    {
        prefix.pop_back();
    }
    return prefix;
}

} // namespace

RequestNamer::RequestNamer(const crypto::CryptoContext& ctx)
    : ctx_(ctx)
{
}

std::vector<uint8_t> RequestNamer::canonicalize(const CertificateSpec& spec)
{
    utils::DataWriter writer;

    writer.append(CommonName, std::string_view(spec.commonName));
    appendList(writer, Organizations, spec.subject.organizations);
    appendList(writer, Countries, spec.subject.countries);
    appendList(writer, OrganizationalUnits, spec.subject.organizationalUnits);
    appendList(writer, Localities, spec.subject.localities);
    appendList(writer, Provinces, spec.subject.provinces);
    appendList(writer, StreetAddresses, spec.subject.streetAddresses);
    appendList(writer, PostalCodes, spec.subject.postalCodes);
    writer.append(SerialNumber, std::string_view(spec.subject.serialNumber));

    appendList(writer, DNSNames, spec.dnsNames);
    appendList(writer, IPAddresses, spec.ipAddresses);
    appendList(writer, URISANs, spec.uriSANs);
    appendList(writer, EmailSANs, spec.emailSANs);

    writer.append(Duration, std::string_view(std::to_string(spec.duration.count())));

    writer.append(IssuerName, std::string_view(spec.issuerRef.name));
    writer.append(IssuerKind, std::string_view(spec.issuerRef.kind));
    writer.append(IssuerGroup, std::string_view(spec.issuerRef.group));
    writer.append(IsCA, spec.isCA);

    writer.append(Usages, static_cast<uint64_t>(spec.usages.size()));
    for (auto usage : spec.usages)
    {
        writer.append(Usages, toString(usage));
    }

    writer.append(KeyAlgorithmTag, toString(spec.keyAlgorithm));
    writer.append(KeySize, std::string_view(std::to_string(spec.keySize)));
    writer.append(KeyEncodingTag, toString(spec.keyEncoding));

    auto data = writer.data();
    return std::vector<uint8_t>(data.begin(), data.end());
}

std::string RequestNamer::computeName(const Certificate& crt) const
{
    auto prefix = shortenPrefix(crt.metadata.name);
    if (prefix.empty())
    {
        throw crypto::CryptoException(make_error_code(Errc::InvalidSpec), "certificate name must not be empty");
    }

    std::vector<uint8_t> digest;
    try
    {
        auto canonical = canonicalize(crt.spec);
        auto sha256 = ctx_.fetchDigest("SHA256");
        digest = crypto::HashTraits::digest(sha256, canonical);
    }
    catch (const std::exception& e)
    {
        throw crypto::CryptoException(make_error_code(Errc::HashingFailure),
                                      std::string("failed to hash certificate spec: ") + e.what());
    }

    return prefix + "-" + utils::hexlify(std::span<const uint8_t>(digest.data(), kDigestPrefixLength));
}

} // namespace certreq::request
