#include <set>
#include <gtest/gtest.h>

#include <certreq/api/types.hpp>
#include <certreq/crypto/exception.hpp>

using namespace certreq;
using namespace certreq::api;

TEST(KeyUsageTest, NamesAreUniqueAndParseBack)
{
    std::set<std::string_view> names;
    for (int i = static_cast<int>(KeyUsage::Signing); i <= static_cast<int>(KeyUsage::NetscapeSGC); ++i)
    {
        auto usage = static_cast<KeyUsage>(i);
        auto name = toString(usage);
        EXPECT_TRUE(names.insert(name).second) << name;
        EXPECT_EQ(keyUsageFromString(name), usage);
    }
    EXPECT_EQ(names.size(), 23U);
}

TEST(KeyUsageTest, CaseInsensitive)
{
    EXPECT_EQ(keyUsageFromString("Server Auth"), KeyUsage::ServerAuth);
    EXPECT_EQ(keyUsageFromString("S/MIME"), KeyUsage::SMIME);
    EXPECT_EQ(toString(KeyUsage::DigitalSignature), "digital signature");
}

TEST(KeyUsageTest, Unknown)
{
    try
    {
        (void)keyUsageFromString("server-auth");
        FAIL() << "expected an exception";
    }
    catch (const crypto::CryptoException& e)
    {
        EXPECT_EQ(e.code(), make_error_code(Errc::InvalidSpec));
    }
}

TEST(KeyAlgorithmTest, Parse)
{
    EXPECT_EQ(keyAlgorithmFromString(""), KeyAlgorithm::RSA);
    EXPECT_EQ(keyAlgorithmFromString("RSA"), KeyAlgorithm::RSA);
    EXPECT_EQ(keyAlgorithmFromString("ecdsa"), KeyAlgorithm::ECDSA);
    EXPECT_EQ(toString(KeyAlgorithm::ECDSA), "ecdsa");

    try
    {
        (void)keyAlgorithmFromString("dsa");
        FAIL() << "expected an exception";
    }
    catch (const crypto::CryptoException& e)
    {
        EXPECT_EQ(e.code(), make_error_code(Errc::UnsupportedAlgorithm));
    }
}

TEST(KeyEncodingTest, Parse)
{
    EXPECT_EQ(keyEncodingFromString(""), KeyEncoding::PKCS1);
    EXPECT_EQ(keyEncodingFromString("PKCS1"), KeyEncoding::PKCS1);
    EXPECT_EQ(keyEncodingFromString("pkcs8"), KeyEncoding::PKCS8);
    EXPECT_EQ(toString(KeyEncoding::PKCS8), "pkcs8");

    try
    {
        (void)keyEncodingFromString("pkcs12");
        FAIL() << "expected an exception";
    }
    catch (const crypto::CryptoException& e)
    {
        EXPECT_EQ(e.code(), make_error_code(Errc::UnsupportedEncoding));
    }
}

TEST(ErrcTest, Category)
{
    auto ec = make_error_code(Errc::KeyMismatch);
    EXPECT_STREQ(ec.category().name(), "certreq");
    EXPECT_FALSE(ec.message().empty());

    std::error_code converted = Errc::HashingFailure;
    EXPECT_EQ(converted, make_error_code(Errc::HashingFailure));
}
