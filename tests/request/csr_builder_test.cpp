#include <gtest/gtest.h>
#include <openssl/objects.h>
#include <openssl/x509.h>

#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/req.hpp>
#include <certreq/request/csr_builder.hpp>

#include "certificate_fixture.hpp"

using namespace certreq;
using namespace certreq::crypto;
using namespace certreq::request;

namespace
{

std::vector<std::string> entries(X509Req* req, int nid)
{
    std::vector<std::string> result;
    auto name = X509_REQ_get_subject_name(req);
    for (int i = X509_NAME_get_index_by_NID(name, nid, -1); i >= 0; i = X509_NAME_get_index_by_NID(name, nid, i))
    {
        auto data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, i));
        result.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(data)), ASN1_STRING_length(data));
    }
    return result;
}

int position(X509Req* req, int nid)
{
    return X509_NAME_get_index_by_NID(X509_REQ_get_subject_name(req), nid, -1);
}

} // namespace

class CsrBuilderTest : public testing::Test
{
protected:
    CryptoContext ctx_;
    CsrBuilder builder_{ctx_};
    api::CertificateSpec spec_{test::makeWebCertificate().spec};
};

TEST_F(CsrBuilderTest, SubjectFromSpec)
{
    spec_.subject.organizations = {"Example Inc", "Example Holdings"};
    spec_.subject.organizationalUnits = {"Platform"};
    spec_.subject.countries = {"GB"};
    spec_.subject.provinces = {"London"};
    spec_.subject.localities = {"Camden"};
    spec_.subject.streetAddresses = {"1 High Street"};
    spec_.subject.postalCodes = {"NW1 1AA"};
    spec_.subject.serialNumber = "42";

    CsrTemplate csr;
    ASSERT_NO_THROW(csr = builder_.build(spec_));
    ASSERT_NE(csr.request, nullptr);

    EXPECT_EQ(Req::version(csr.request), 0);
    EXPECT_EQ(Req::commonName(csr.request), "example.com");
    EXPECT_EQ(entries(csr.request, NID_organizationName), spec_.subject.organizations);
    EXPECT_EQ(entries(csr.request, NID_organizationalUnitName), spec_.subject.organizationalUnits);
    EXPECT_EQ(entries(csr.request, NID_countryName), spec_.subject.countries);
    EXPECT_EQ(entries(csr.request, NID_stateOrProvinceName), spec_.subject.provinces);
    EXPECT_EQ(entries(csr.request, NID_localityName), spec_.subject.localities);
    EXPECT_EQ(entries(csr.request, NID_streetAddress), spec_.subject.streetAddresses);
    EXPECT_EQ(entries(csr.request, NID_postalCode), spec_.subject.postalCodes);
    EXPECT_EQ(entries(csr.request, NID_serialNumber), std::vector<std::string>{"42"});

    EXPECT_LT(position(csr.request, NID_organizationName), position(csr.request, NID_countryName));
    EXPECT_LT(position(csr.request, NID_serialNumber), position(csr.request, NID_commonName));
}

TEST_F(CsrBuilderTest, SubjectAltNames)
{
    spec_.dnsNames = {"example.com", "www.example.com"};
    spec_.ipAddresses = {"10.0.0.1", "::1"};
    spec_.uriSANs = {"spiffe://cluster.local/ns/default/sa/web"};
    spec_.emailSANs = {"admin@example.com"};

    auto csr = builder_.build(spec_);

    EXPECT_EQ(Req::dnsNames(csr.request), spec_.dnsNames);

    auto ext = Req::findExtension(csr.request, NID_subject_alt_name);
    ASSERT_NE(ext, nullptr);
    GeneralNamesPtr names(static_cast<GENERAL_NAMES*>(X509V3_EXT_d2i(ext)));
    ASSERT_NE(names, nullptr);
    ASSERT_EQ(sk_GENERAL_NAME_num(names), 6);
    EXPECT_EQ(sk_GENERAL_NAME_value(names, 0)->type, GEN_DNS);
    EXPECT_EQ(sk_GENERAL_NAME_value(names, 2)->type, GEN_EMAIL);
    EXPECT_EQ(sk_GENERAL_NAME_value(names, 3)->type, GEN_IPADD);
    EXPECT_EQ(sk_GENERAL_NAME_value(names, 4)->type, GEN_IPADD);
    EXPECT_EQ(sk_GENERAL_NAME_value(names, 5)->type, GEN_URI);
}

TEST_F(CsrBuilderTest, NoSubjectAltNameWithoutEntries)
{
    auto csr = builder_.build(spec_);
    EXPECT_EQ(Req::findExtension(csr.request, NID_subject_alt_name), nullptr);
    EXPECT_TRUE(Req::dnsNames(csr.request).empty());
}

TEST_F(CsrBuilderTest, SubjectAltNameWithoutCommonName)
{
    spec_.commonName.clear();
    spec_.dnsNames = {"example.com"};

    CsrTemplate csr;
    ASSERT_NO_THROW(csr = builder_.build(spec_));
    EXPECT_EQ(Req::commonName(csr.request), "");
    EXPECT_EQ(position(csr.request, NID_commonName), -1);
}

TEST_F(CsrBuilderTest, RequiresCommonNameOrSubjectAltName)
{
    spec_.commonName.clear();
    test::expectErrc([&] { (void)builder_.build(spec_); }, Errc::InvalidSpec);
}

TEST_F(CsrBuilderTest, MalformedIpAddress)
{
    spec_.ipAddresses = {"10.0.0.256"};
    test::expectErrc([&] { (void)builder_.build(spec_); }, Errc::InvalidSpec);
}

TEST_F(CsrBuilderTest, NonAsciiDnsName)
{
    spec_.dnsNames = {"ex\xc3\xa4mple.com"};
    test::expectErrc([&] { (void)builder_.build(spec_); }, Errc::InvalidSpec);
}

TEST_F(CsrBuilderTest, NonAsciiEmailAddress)
{
    spec_.emailSANs = {"b\xc3\xbc@example.com"};
    test::expectErrc([&] { (void)builder_.build(spec_); }, Errc::InvalidSpec);
}

TEST_F(CsrBuilderTest, UriWithoutScheme)
{
    for (auto uri : {"cluster.local/web", "://cluster.local", "1http://cluster.local", "sp iffe://web"})
    {
        spec_.uriSANs = {uri};
        test::expectErrc([&] { (void)builder_.build(spec_); }, Errc::InvalidSpec);
    }
}

TEST_F(CsrBuilderTest, NonAsciiUri)
{
    spec_.uriSANs = {"https://ex\xc3\xa4mple.com/"};
    test::expectErrc([&] { (void)builder_.build(spec_); }, Errc::InvalidSpec);
}

TEST_F(CsrBuilderTest, UriSchemes)
{
    spec_.uriSANs = {"urn:uuid:6e8bc430-9c3a-11d9-9669-0800200c9a66", "git+ssh://example.com/repo"};
    EXPECT_NO_THROW((void)builder_.build(spec_));
}

TEST_F(CsrBuilderTest, MalformedCountry)
{
    spec_.subject.countries = {"GBR"};
    test::expectErrc([&] { (void)builder_.build(spec_); }, Errc::InvalidSpec);
}

TEST_F(CsrBuilderTest, UnsupportedKeySize)
{
    spec_.keySize = 1024;
    test::expectErrc([&] { (void)builder_.build(spec_); }, Errc::UnsupportedAlgorithm);
}

TEST_F(CsrBuilderTest, SignatureAlgorithmFollowsKey)
{
    EXPECT_EQ(builder_.build(spec_).signatureAlgorithm, SignatureAlgorithm::SHA256WithRSA);

    spec_.keyAlgorithm = api::KeyAlgorithm::ECDSA;
    spec_.keySize = 384;
    EXPECT_EQ(builder_.build(spec_).signatureAlgorithm, SignatureAlgorithm::ECDSAWithSHA384);
}

TEST_F(CsrBuilderTest, DefaultUsages)
{
    spec_.usages.clear();
    EXPECT_EQ(CsrBuilder::keyUsageValue(spec_), "critical,digitalSignature,keyEncipherment");
    EXPECT_EQ(CsrBuilder::extKeyUsageValue(spec_), "");

    auto csr = builder_.build(spec_);
    EXPECT_NE(Req::findExtension(csr.request, NID_key_usage), nullptr);
    EXPECT_EQ(Req::findExtension(csr.request, NID_ext_key_usage), nullptr);
    EXPECT_EQ(Req::findExtension(csr.request, NID_basic_constraints), nullptr);
}

TEST_F(CsrBuilderTest, ExtendedUsagesOnly)
{
    EXPECT_EQ(CsrBuilder::keyUsageValue(spec_), "");
    EXPECT_EQ(CsrBuilder::extKeyUsageValue(spec_), "serverAuth");

    auto csr = builder_.build(spec_);
    EXPECT_EQ(Req::findExtension(csr.request, NID_key_usage), nullptr);
    EXPECT_NE(Req::findExtension(csr.request, NID_ext_key_usage), nullptr);
}

TEST_F(CsrBuilderTest, MixedUsagesAreDeduplicated)
{
    using api::KeyUsage;
    spec_.usages = {KeyUsage::Signing,    KeyUsage::DigitalSignature, KeyUsage::KeyEncipherment,
                    KeyUsage::ServerAuth, KeyUsage::ClientAuth,       KeyUsage::EmailProtection,
                    KeyUsage::SMIME};

    EXPECT_EQ(CsrBuilder::keyUsageValue(spec_), "critical,digitalSignature,keyEncipherment");
    EXPECT_EQ(CsrBuilder::extKeyUsageValue(spec_), "serverAuth,clientAuth,emailProtection");
}

TEST_F(CsrBuilderTest, CertificateAuthority)
{
    spec_.isCA = true;
    spec_.usages.clear();

    EXPECT_EQ(CsrBuilder::keyUsageValue(spec_), "critical,digitalSignature,keyEncipherment,keyCertSign");

    auto csr = builder_.build(spec_);
    auto ext = Req::findExtension(csr.request, NID_basic_constraints);
    ASSERT_NE(ext, nullptr);
    EXPECT_EQ(X509_EXTENSION_get_critical(ext), 1);

    BASIC_CONSTRAINTS* bc = static_cast<BASIC_CONSTRAINTS*>(X509V3_EXT_d2i(ext));
    ASSERT_NE(bc, nullptr);
    EXPECT_NE(bc->ca, 0);
    BASIC_CONSTRAINTS_free(bc);
}

TEST_F(CsrBuilderTest, AllUsagesAreAccepted)
{
    for (int i = static_cast<int>(api::KeyUsage::Signing); i <= static_cast<int>(api::KeyUsage::NetscapeSGC); ++i)
    {
        spec_.usages = {static_cast<api::KeyUsage>(i)};
        EXPECT_NO_THROW((void)builder_.build(spec_)) << api::toString(spec_.usages.front());
    }
}
