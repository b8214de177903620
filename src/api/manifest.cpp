#include <certreq/api/manifest.hpp>

namespace certreq::api
{

namespace
{

template <typename Spec>
void copySharedFields(const Spec& from, CertificateSpec& to)
{
    to.commonName = from.commonName;
    to.duration = from.duration;
    to.renewBefore = from.renewBefore;
    to.dnsNames = from.dnsNames;
    to.ipAddresses = from.ipAddresses;
    to.uriSANs = from.uriSANs;
    to.emailSANs = from.emailSANs;
    to.secretName = from.secretName;
    to.issuerRef = from.issuerRef;
    to.isCA = from.isCA;
    to.usages = from.usages;
}

int effectiveSize(KeyAlgorithm algorithm, int size)
{
    return size == 0 ? defaultKeySize(algorithm) : size;
}

} // namespace

std::string_view apiVersionOf(const CertificateManifest& manifest)
{
    if (std::holds_alternative<v1::Certificate>(manifest))
    {
        return v1::kApiVersion;
    }
    return v1alpha2::kApiVersion;
}

Certificate toCertificate(const v1alpha2::Certificate& manifest)
{
    Certificate result;
    result.metadata = manifest.metadata;

    const auto& from = manifest.spec;
    auto& to = result.spec;

    copySharedFields(from, to);

    to.subject = from.subject;
    to.subject.organizations = from.organization;
    to.subject.organizations.insert(to.subject.organizations.end(), from.subject.organizations.begin(),
                                    from.subject.organizations.end());

    to.keyAlgorithm = from.keyAlgorithm;
    to.keySize = effectiveSize(from.keyAlgorithm, from.keySize);
    to.keyEncoding = from.keyEncoding;

    return result;
}

Certificate toCertificate(const v1::Certificate& manifest)
{
    Certificate result;
    result.metadata = manifest.metadata;

    const auto& from = manifest.spec;
    auto& to = result.spec;

    copySharedFields(from, to);

    to.subject = from.subject;
    to.keyAlgorithm = from.privateKey.algorithm;
    to.keySize = effectiveSize(from.privateKey.algorithm, from.privateKey.size);
    to.keyEncoding = from.privateKey.encoding;

    return result;
}

Certificate toCertificate(const CertificateManifest& manifest)
{
    return std::visit([](const auto& m) { return toCertificate(m); }, manifest);
}

} // namespace certreq::api
