#include <gtest/gtest.h>
#include <openssl/objects.h>
#include <openssl/x509.h>

#include <certreq/crypto/asymm_key.hpp>
#include <certreq/crypto/asymm_keygen.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/pem.hpp>
#include <certreq/crypto/req.hpp>
#include <certreq/request/csr_signer.hpp>

#include "certificate_fixture.hpp"

using namespace certreq;
using namespace certreq::crypto;
using namespace certreq::request;

class CsrSignerTest : public testing::Test
{
public:
    static void SetUpTestSuite()
    {
        rsaKey_ = akey::rsa::generate(ctx_, 2048).release();
    }

    static void TearDownTestSuite()
    {
        EVP_PKEY_free(rsaKey_);
        rsaKey_ = nullptr;
    }

protected:
    static inline CryptoContext ctx_;
    static inline Key* rsaKey_{nullptr};

    CsrBuilder builder_{ctx_};
    CsrSigner signer_{ctx_};
    api::CertificateSpec spec_{test::makeWebCertificate().spec};
};

TEST_F(CsrSignerTest, PemEnvelope)
{
    auto csr = builder_.build(spec_);

    SignedCsr result;
    ASSERT_NO_THROW(result = signer_.sign(csr, rsaKey_));

    const std::string begin = "-----BEGIN CERTIFICATE REQUEST-----\n";
    const std::string end = "-----END CERTIFICATE REQUEST-----\n";
    ASSERT_GT(result.pem.size(), begin.size() + end.size());
    EXPECT_EQ(result.pem.substr(0, begin.size()), begin);
    EXPECT_EQ(result.pem.substr(result.pem.size() - end.size()), end);

    auto block = Pem::decode(result.pem);
    EXPECT_EQ(block.label, kCertificateRequestLabel);
    EXPECT_EQ(block.der, result.der);
}

TEST_F(CsrSignerTest, SignedRequestIsConsistent)
{
    auto csr = builder_.build(spec_);
    auto result = signer_.sign(csr, rsaKey_);

    auto parsed = Req::fromDer(result.der, ctx_);
    EXPECT_TRUE(Req::verify(parsed, rsaKey_, ctx_));
    EXPECT_TRUE(AsymmKey::isEqual(Req::publicKey(parsed), rsaKey_));
    EXPECT_EQ(Req::commonName(parsed), "example.com");
    EXPECT_EQ(X509_REQ_get_signature_nid(parsed), NID_sha256WithRSAEncryption);
}

TEST_F(CsrSignerTest, RsaSignatureIsDeterministic)
{
    auto first = builder_.build(spec_);
    auto second = builder_.build(spec_);

    auto a = signer_.sign(first, rsaKey_);
    auto b = signer_.sign(second, rsaKey_);

    EXPECT_EQ(a.der, b.der);
    EXPECT_EQ(a.pem, b.pem);
}

TEST_F(CsrSignerTest, EcdsaSignatureIsValid)
{
    spec_.keyAlgorithm = api::KeyAlgorithm::ECDSA;
    spec_.keySize = 384;
    auto key = akey::ec::generate(ctx_, "secp384r1");

    for (int i = 0; i < 2; ++i)
    {
        auto csr = builder_.build(spec_);
        auto result = signer_.sign(csr, key);

        auto parsed = Req::fromDer(result.der, ctx_);
        EXPECT_TRUE(Req::verify(parsed, key, ctx_));
        EXPECT_EQ(X509_REQ_get_signature_nid(parsed), NID_ecdsa_with_SHA384);
    }
}

TEST_F(CsrSignerTest, IncompatibleKey)
{
    auto csr = builder_.build(spec_);
    auto ecKey = akey::ec::generate(ctx_, "prime256v1");

    test::expectErrc([&] { (void)signer_.sign(csr, ecKey); }, Errc::IncompatibleKeyAlgorithm);
}

TEST_F(CsrSignerTest, IncompatibleRsaKeyForEcdsa)
{
    spec_.keyAlgorithm = api::KeyAlgorithm::ECDSA;
    spec_.keySize = 256;
    auto csr = builder_.build(spec_);

    test::expectErrc([&] { (void)signer_.sign(csr, rsaKey_); }, Errc::IncompatibleKeyAlgorithm);
}

TEST_F(CsrSignerTest, ConsistencyCheckRejectsOtherKey)
{
    auto csr = builder_.build(spec_);
    auto result = signer_.sign(csr, rsaKey_);
    auto parsed = Req::fromDer(result.der, ctx_);

    auto other = akey::rsa::generate(ctx_, 2048);
    test::expectErrc([&] { signer_.checkConsistency(parsed, other); }, Errc::KeyMismatch);
    EXPECT_NO_THROW(signer_.checkConsistency(parsed, rsaKey_));
}
