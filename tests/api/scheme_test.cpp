#include <sstream>
#include <gtest/gtest.h>

#include <certreq/api/scheme.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/request/request_namer.hpp>

using namespace certreq;
using namespace certreq::api;
using namespace std::chrono_literals;

namespace
{

const char* kV1Alpha2Document = R"(
# web certificate
[manifest]
apiVersion = cert-manager.io/v1alpha2
kind = Certificate

[metadata]
name = web
namespace = prod

[labels]
app = web

[annotations]
team = platform

[spec]
commonName = example.com
duration = 90d
renewBefore = 360h
secretName = web-tls
isCA = false
usages = server auth, client auth
dnsNames = example.com, www.example.com
organization = Example Inc
keyAlgorithm = ecdsa
keySize = 384
keyEncoding = pkcs8

[subject]
countries = GB

[issuerRef]
name = ca-issuer
kind = ClusterIssuer
)";

const char* kV1Document = R"(
[manifest]
apiVersion = cert-manager.io/v1
kind = Certificate

[metadata]
name = web
namespace = prod

[labels]
app = web

[annotations]
team = platform

[spec]
commonName = example.com
duration = 2160h
renewBefore = 15d
secretName = web-tls
usages = server auth, client auth
dnsNames = example.com, www.example.com

[subject]
organizations = Example Inc
countries = GB

[issuerRef]
name = ca-issuer
kind = ClusterIssuer

[privateKey]
algorithm = ECDSA
encoding = PKCS8
size = 384
)";

config::ConfigParser parse(const std::string& text)
{
    std::istringstream input(text);
    config::ConfigParser parser;
    parser.parse(input, "test");
    return parser;
}

void expectInvalid(const Scheme& scheme, const std::string& text)
{
    auto document = parse(text);
    try
    {
        (void)scheme.decode(document);
        ADD_FAILURE() << "document accepted";
    }
    catch (const crypto::CryptoException& e)
    {
        EXPECT_EQ(e.code(), make_error_code(Errc::InvalidSpec)) << e.what();
    }
}

} // namespace

TEST(SchemeTest, DefaultVersions)
{
    auto scheme = Scheme::defaultScheme();
    EXPECT_TRUE(scheme.recognizes("cert-manager.io/v1alpha2"));
    EXPECT_TRUE(scheme.recognizes("cert-manager.io/v1"));
    EXPECT_FALSE(scheme.recognizes("cert-manager.io/v1beta1"));
    EXPECT_EQ(scheme.versions().size(), 2U);
}

TEST(SchemeTest, DecodeV1Alpha2)
{
    auto manifest = Scheme::defaultScheme().decode(parse(kV1Alpha2Document));
    ASSERT_TRUE(std::holds_alternative<v1alpha2::Certificate>(manifest));
    EXPECT_EQ(apiVersionOf(manifest), "cert-manager.io/v1alpha2");

    const auto& crt = std::get<v1alpha2::Certificate>(manifest);
    EXPECT_EQ(crt.metadata.name, "web");
    EXPECT_EQ(crt.metadata.nameSpace, "prod");
    EXPECT_EQ(crt.metadata.labels.at("app"), "web");
    EXPECT_EQ(crt.spec.organization, std::vector<std::string>{"Example Inc"});
    EXPECT_EQ(crt.spec.duration, 2160h);
    EXPECT_EQ(crt.spec.renewBefore, 360h);
    EXPECT_EQ(crt.spec.keyAlgorithm, KeyAlgorithm::ECDSA);
    EXPECT_EQ(crt.spec.keySize, 384);
    EXPECT_EQ(crt.spec.keyEncoding, KeyEncoding::PKCS8);
    ASSERT_EQ(crt.spec.usages.size(), 2U);
    EXPECT_EQ(crt.spec.usages[1], KeyUsage::ClientAuth);
    EXPECT_EQ(crt.spec.issuerRef.kind, "ClusterIssuer");
}

TEST(SchemeTest, DecodeV1)
{
    auto manifest = Scheme::defaultScheme().decode(parse(kV1Document));
    ASSERT_TRUE(std::holds_alternative<v1::Certificate>(manifest));

    const auto& crt = std::get<v1::Certificate>(manifest);
    EXPECT_EQ(crt.spec.privateKey.algorithm, KeyAlgorithm::ECDSA);
    EXPECT_EQ(crt.spec.privateKey.size, 384);
    EXPECT_EQ(crt.spec.subject.organizations, std::vector<std::string>{"Example Inc"});
}

TEST(SchemeTest, VersionsConvertToSameCertificate)
{
    auto scheme = Scheme::defaultScheme();
    auto a = toCertificate(scheme.decode(parse(kV1Alpha2Document)));
    auto b = toCertificate(scheme.decode(parse(kV1Document)));

    EXPECT_EQ(a.spec.subject.organizations, b.spec.subject.organizations);
    EXPECT_EQ(a.spec.keyAlgorithm, b.spec.keyAlgorithm);
    EXPECT_EQ(a.spec.keySize, b.spec.keySize);
    EXPECT_EQ(a.spec.keyEncoding, b.spec.keyEncoding);
    EXPECT_EQ(a.spec.duration, b.spec.duration);
    EXPECT_EQ(a.spec.renewBefore, b.spec.renewBefore);
    EXPECT_EQ(request::RequestNamer::canonicalize(a.spec), request::RequestNamer::canonicalize(b.spec));
}

TEST(SchemeTest, DefaultKeySizeOnConversion)
{
    v1alpha2::Certificate rsa;
    EXPECT_EQ(toCertificate(rsa).spec.keySize, 2048);

    v1::Certificate ec;
    ec.spec.privateKey.algorithm = KeyAlgorithm::ECDSA;
    EXPECT_EQ(toCertificate(ec).spec.keySize, 256);

    ec.spec.privateKey.size = 521;
    EXPECT_EQ(toCertificate(ec).spec.keySize, 521);
}

TEST(SchemeTest, OrganizationsAreMerged)
{
    v1alpha2::Certificate crt;
    crt.spec.organization = {"First"};
    crt.spec.subject.organizations = {"Second"};

    auto converted = toCertificate(crt);
    EXPECT_EQ(converted.spec.subject.organizations, (std::vector<std::string>{"First", "Second"}));
}

TEST(SchemeTest, UnknownVersion)
{
    expectInvalid(Scheme::defaultScheme(), "[manifest]\napiVersion = cert-manager.io/v9\nkind = Certificate\n");
}

TEST(SchemeTest, MissingManifest)
{
    expectInvalid(Scheme::defaultScheme(), "[metadata]\nname = web\n");
}

TEST(SchemeTest, WrongKind)
{
    expectInvalid(Scheme::defaultScheme(), "[manifest]\napiVersion = cert-manager.io/v1\nkind = Issuer\n");
}

TEST(SchemeTest, MalformedValues)
{
    const std::string header = "[manifest]\napiVersion = cert-manager.io/v1\nkind = Certificate\n";
    auto scheme = Scheme::defaultScheme();

    expectInvalid(scheme, header + "[spec]\nisCA = maybe\n");
    expectInvalid(scheme, header + "[spec]\nduration = forever\n");
    expectInvalid(scheme, header + "[spec]\nusages = flying\n");
    expectInvalid(scheme, header + "[privateKey]\nsize = big\n");
}

TEST(SchemeTest, RestrictedScheme)
{
    Scheme scheme;
    scheme.addVersion(std::string(v1::kApiVersion), decodeV1);

    EXPECT_NO_THROW((void)scheme.decode(parse(kV1Document)));
    expectInvalid(scheme, kV1Alpha2Document);
}
