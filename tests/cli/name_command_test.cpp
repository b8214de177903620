#include <sstream>
#include <gtest/gtest.h>

#include <certreq/api/scheme.hpp>
#include <certreq/cmd/name_command.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/request/request_namer.hpp>

#include "document_fixture.hpp"

using namespace certreq;

namespace
{

std::string runName(const std::string& document)
{
    test::DocumentFile file(document);
    auto path = file.path();

    std::ostringstream out;
    cmd::NameCommand command(out);
    command.execute({"-f", path});
    return out.str();
}

} // namespace

TEST(NameCommandTest, PrintsIdentifierOnly)
{
    auto text = test::webDocument();
    auto printed = runName(text);

    std::istringstream input(text);
    config::ConfigParser document;
    document.parse(input, "web");

    crypto::CryptoContext ctx;
    request::RequestNamer namer(ctx);
    auto expected = namer.computeName(api::toCertificate(api::Scheme::defaultScheme().decode(document)));

    EXPECT_EQ(printed, expected + "\n");
    EXPECT_EQ(printed.rfind("web-", 0), 0U);
}

TEST(NameCommandTest, StableAcrossRuns)
{
    EXPECT_EQ(runName(test::webDocument()), runName(test::webDocument()));
}

TEST(NameCommandTest, NamespaceDoesNotChangeIdentifier)
{
    EXPECT_EQ(runName(test::webDocument()), runName(test::webDocument("namespace = prod\n")));
}

TEST(NameCommandTest, InvalidDocument)
{
    try
    {
        runName("[manifest]\napiVersion = cert-manager.io/v9\nkind = Certificate\n");
        FAIL() << "expected an exception";
    }
    catch (const crypto::CryptoException& e)
    {
        EXPECT_EQ(e.code(), make_error_code(Errc::InvalidSpec));
    }
}
