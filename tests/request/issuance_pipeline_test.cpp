#include <gtest/gtest.h>

#include <certreq/api/manifest.hpp>
#include <certreq/crypto/asymm_key.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/pem.hpp>
#include <certreq/crypto/req.hpp>
#include <certreq/request/issuance_pipeline.hpp>

#include "certificate_fixture.hpp"

using namespace certreq;
using namespace certreq::crypto;
using namespace certreq::request;

using Stage = IssuancePipeline::Stage;

class IssuancePipelineTest : public testing::Test
{
protected:
    X509ReqPtr parse(const api::CertificateRequest& req)
    {
        auto block = Pem::decode(req.spec.csrPEM);
        EXPECT_EQ(block.label, "CERTIFICATE REQUEST");
        return Req::fromDer(block.der, ctx_);
    }

    CryptoContext ctx_;
    IssuancePipeline pipeline_{ctx_};
};

TEST_F(IssuancePipelineTest, WebCertificate)
{
    auto crt = test::makeWebCertificate();

    api::CertificateRequest req;
    ASSERT_NO_THROW(req = pipeline_.run(crt));
    EXPECT_EQ(pipeline_.stage(), Stage::Done);
    EXPECT_FALSE(pipeline_.failure());

    EXPECT_EQ(req.metadata.generateName, "web-");
    EXPECT_EQ(req.metadata.annotations.at(std::string(api::kPrivateKeySecretNameAnnotation)), "web-tls");
    EXPECT_EQ(req.metadata.annotations.at(std::string(api::kCertificateNameAnnotation)), "web");
    EXPECT_EQ(req.spec.duration, std::chrono::hours(24 * 90));
    EXPECT_EQ(req.spec.issuerRef.name, "ca-issuer");
    EXPECT_FALSE(req.spec.isCA);
    EXPECT_EQ(req.spec.usages, std::vector<api::KeyUsage>{api::KeyUsage::ServerAuth});

    auto csr = parse(req);
    EXPECT_EQ(Req::commonName(csr), "example.com");

    auto publicKey = Req::publicKey(csr);
    ASSERT_NE(publicKey, nullptr);
    EXPECT_TRUE(AsymmKey::isAlgorithm(publicKey, "RSA"));
    EXPECT_EQ(AsymmKey::bits(publicKey), 2048);
    EXPECT_TRUE(Req::verify(csr, publicKey, ctx_));

    EXPECT_EQ(req.identifier, RequestNamer(ctx_).computeName(crt));
}

TEST_F(IssuancePipelineTest, IdentifierIsStableAcrossRuns)
{
    auto crt = test::makeWebCertificate();

    auto first = pipeline_.run(crt);
    auto second = pipeline_.run(crt);

    EXPECT_EQ(first.identifier, second.identifier);
    EXPECT_NE(first.spec.csrPEM, second.spec.csrPEM);
}

TEST_F(IssuancePipelineTest, DistinctCommonNames)
{
    auto a = test::makeWebCertificate();
    auto b = test::makeWebCertificate();
    b.spec.commonName = "example.org";

    EXPECT_NE(pipeline_.run(a).identifier, pipeline_.run(b).identifier);
}

TEST_F(IssuancePipelineTest, UnsupportedKeySize)
{
    auto crt = test::makeWebCertificate();
    crt.spec.keySize = 0;

    test::expectErrc([&] { (void)pipeline_.run(crt); }, Errc::UnsupportedAlgorithm);
    EXPECT_EQ(pipeline_.stage(), Stage::Failed);
    EXPECT_EQ(pipeline_.failedAfter(), Stage::NameComputed);
    EXPECT_EQ(pipeline_.failure(), make_error_code(Errc::UnsupportedAlgorithm));
    EXPECT_FALSE(pipeline_.failureReason().empty());
}

TEST_F(IssuancePipelineTest, InvalidSubject)
{
    auto crt = test::makeWebCertificate();
    crt.spec.commonName.clear();

    test::expectErrc([&] { (void)pipeline_.run(crt); }, Errc::InvalidSpec);
    EXPECT_EQ(pipeline_.stage(), Stage::Failed);
    EXPECT_EQ(pipeline_.failedAfter(), Stage::KeyEncoded);
}

TEST_F(IssuancePipelineTest, EmptyName)
{
    auto crt = test::makeWebCertificate();
    crt.metadata.name.clear();

    test::expectErrc([&] { (void)pipeline_.run(crt); }, Errc::InvalidSpec);
    EXPECT_EQ(pipeline_.failedAfter(), Stage::SpecLoaded);
}

TEST_F(IssuancePipelineTest, RestartsAfterFailure)
{
    auto crt = test::makeWebCertificate();
    crt.spec.keySize = 1024;
    EXPECT_THROW(pipeline_.run(crt), CryptoException);
    EXPECT_EQ(pipeline_.stage(), Stage::Failed);

    crt.spec.keySize = 2048;
    EXPECT_NO_THROW(pipeline_.run(crt));
    EXPECT_EQ(pipeline_.stage(), Stage::Done);
    EXPECT_FALSE(pipeline_.failure());
    EXPECT_TRUE(pipeline_.failureReason().empty());
}

TEST_F(IssuancePipelineTest, Pkcs8EcdsaKey)
{
    auto crt = test::makeWebCertificate();
    crt.spec.keyAlgorithm = api::KeyAlgorithm::ECDSA;
    crt.spec.keySize = 521;
    crt.spec.keyEncoding = api::KeyEncoding::PKCS8;
    crt.spec.dnsNames = {"example.com", "www.example.com"};

    auto req = pipeline_.run(crt);
    auto csr = parse(req);

    auto publicKey = Req::publicKey(csr);
    EXPECT_TRUE(AsymmKey::isAlgorithm(publicKey, "EC"));
    EXPECT_EQ(AsymmKey::groupName(publicKey), "secp521r1");
    EXPECT_EQ(Req::dnsNames(csr), crt.spec.dnsNames);
    EXPECT_EQ(X509_REQ_get_signature_nid(csr), NID_ecdsa_with_SHA512);
}

TEST_F(IssuancePipelineTest, RunsVersionedManifest)
{
    api::v1::Certificate manifest;
    manifest.metadata.name = "edge";
    manifest.spec.commonName = "edge.example.com";
    manifest.spec.issuerRef.name = "ca-issuer";
    manifest.spec.secretName = "edge-tls";
    manifest.spec.privateKey.algorithm = api::KeyAlgorithm::ECDSA;

    auto req = pipeline_.run(api::CertificateManifest{manifest});
    EXPECT_EQ(pipeline_.stage(), Stage::Done);

    auto publicKey = Req::publicKey(parse(req));
    EXPECT_EQ(AsymmKey::groupName(publicKey), "prime256v1");
    EXPECT_EQ(req.metadata.generateName, "edge-");
}

TEST_F(IssuancePipelineTest, IsolatedContext)
{
    auto isolated = CryptoContext::isolated();
    IssuancePipeline pipeline(*isolated);

    auto crt = test::makeWebCertificate();
    auto req = pipeline.run(crt);

    EXPECT_EQ(req.identifier, pipeline_.run(crt).identifier);
}

TEST(IssuancePipelineStageTest, Names)
{
    EXPECT_EQ(toString(Stage::SpecLoaded), "SpecLoaded");
    EXPECT_EQ(toString(Stage::CSRSigned), "CSRSigned");
    EXPECT_EQ(toString(Stage::Failed), "Failed");
}
