#include <algorithm>
#include <vector>

#include <openssl/objects.h>

#include <certreq/request/csr_builder.hpp>
#include <certreq/request/key_parameters.hpp>
#include <certreq/crypto/cert_name_builder.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/crypto/extension.hpp>
#include <certreq/crypto/req_builder.hpp>
#include <certreq/utils/string.hpp>

using namespace certreq::api;

namespace certreq::request
{

namespace
{

const char* keyUsageBit(KeyUsage usage)
{
    switch (usage)
    {
    case KeyUsage::Signing:
    case KeyUsage::DigitalSignature:
        return "digitalSignature";
    case KeyUsage::ContentCommitment:
        return "nonRepudiation";
    case KeyUsage::KeyEncipherment:
        return "keyEncipherment";
    case KeyUsage::KeyAgreement:
        return "keyAgreement";
    case KeyUsage::DataEncipherment:
        return "dataEncipherment";
    case KeyUsage::CertSign:
        return "keyCertSign";
    case KeyUsage::CRLSign:
        return "cRLSign";
    case KeyUsage::EncipherOnly:
        return "encipherOnly";
    case KeyUsage::DecipherOnly:
        return "decipherOnly";
    default:
        return nullptr;
    }
}

const char* extKeyUsagePurpose(KeyUsage usage)
{
    switch (usage)
    {
    case KeyUsage::Any:
        return "anyExtendedKeyUsage";
    case KeyUsage::ServerAuth:
        return "serverAuth";
    case KeyUsage::ClientAuth:
        return "clientAuth";
    case KeyUsage::CodeSigning:
        return "codeSigning";
    case KeyUsage::EmailProtection:
    case KeyUsage::SMIME:
        return "emailProtection";
    case KeyUsage::IPsecEndSystem:
        return "ipsecEndSystem";
    case KeyUsage::IPsecTunnel:
        return "ipsecTunnel";
    case KeyUsage::IPsecUser:
        return "ipsecUser";
    case KeyUsage::Timestamping:
        return "timeStamping";
    case KeyUsage::OCSPSigning:
        return "OCSPSigning";
    case KeyUsage::MicrosoftSGC:
        return "msSGC";
    case KeyUsage::NetscapeSGC:
        return "nsSGC";
    default:
        return nullptr;
    }
}

std::vector<KeyUsage> effectiveUsages(const CertificateSpec& spec)
{
    std::vector<KeyUsage> usages = spec.usages;
    if (usages.empty())
    {
        usages = {KeyUsage::DigitalSignature, KeyUsage::KeyEncipherment};
    }
    if (spec.isCA)
    {
        usages.push_back(KeyUsage::CertSign);
    }
    return usages;
}

void appendUnique(std::vector<std::string>& values, const char* value)
{
    if (value && std::find(values.begin(), values.end(), value) == values.end())
    {
        values.emplace_back(value);
    }
}

bool hasSubjectAltNames(const CertificateSpec& spec)
{
    return !spec.dnsNames.empty() || !spec.ipAddresses.empty() || !spec.uriSANs.empty() ||
           !spec.emailSANs.empty();
}

crypto::X509NamePtr buildSubject(const CertificateSpec& spec)
{
    const auto& subject = spec.subject;
    crypto::CertNameBuilder builder;

    try
    {
        builder.addEntries("O", subject.organizations)
            .addEntries("OU", subject.organizationalUnits)
            .addEntries("C", subject.countries)
            .addEntries("ST", subject.provinces)
            .addEntries("L", subject.localities)
            .addEntries("street", subject.streetAddresses)
            .addEntries("postalCode", subject.postalCodes);

        if (!subject.serialNumber.empty())
        {
            builder.addEntry("serialNumber", subject.serialNumber);
        }
        if (!spec.commonName.empty())
        {
            builder.addEntry("CN", spec.commonName);
        }
    }
    catch (const crypto::CryptoException& e)
    {
        throw crypto::CryptoException(make_error_code(Errc::InvalidSpec),
                                      std::string("invalid subject: ") + e.what());
    }

    return builder.build();
}

} // namespace

CsrBuilder::CsrBuilder(const crypto::CryptoContext& ctx)
    : ctx_(ctx)
{
}

std::string CsrBuilder::keyUsageValue(const CertificateSpec& spec)
{
    std::vector<std::string> bits;
    for (auto usage : effectiveUsages(spec))
    {
        appendUnique(bits, keyUsageBit(usage));
    }

    if (bits.empty())
    {
        return std::string();
    }
    return "critical," + utils::join(bits, ",");
}

std::string CsrBuilder::extKeyUsageValue(const CertificateSpec& spec)
{
    std::vector<std::string> purposes;
    for (auto usage : effectiveUsages(spec))
    {
        appendUnique(purposes, extKeyUsagePurpose(usage));
    }
    return utils::join(purposes, ",");
}

CsrTemplate CsrBuilder::build(const CertificateSpec& spec) const
{
    if (spec.commonName.empty() && !hasSubjectAltNames(spec))
    {
        throw crypto::CryptoException(make_error_code(Errc::InvalidSpec),
                                      "a common name or at least one subject alternative name is required");
    }

    auto params = keyParameters(spec);

    crypto::ReqBuilder builder(ctx_);

    auto subject = buildSubject(spec);
    builder.setSubjectName(subject);

    if (hasSubjectAltNames(spec))
    {
        auto san = crypto::X509Extension::subjectAltName(spec.dnsNames, spec.emailSANs, spec.ipAddresses,
                                                         spec.uriSANs);
        builder.addExtension(san);
    }

    auto keyUsage = keyUsageValue(spec);
    if (!keyUsage.empty())
    {
        builder.addExtension(NID_key_usage, keyUsage);
    }

    auto extKeyUsage = extKeyUsageValue(spec);
    if (!extKeyUsage.empty())
    {
        builder.addExtension(NID_ext_key_usage, extKeyUsage);
    }

    if (spec.isCA)
    {
        builder.addExtension(NID_basic_constraints, "critical,CA:TRUE");
    }

    return CsrTemplate{builder.build(), params.signatureAlgorithm};
}

} // namespace certreq::request
