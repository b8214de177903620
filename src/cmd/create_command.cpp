#include <iostream>

#include <certreq/api/printer.hpp>
#include <certreq/api/scheme.hpp>
#include <certreq/cmd/create_command.hpp>
#include <certreq/config/config_parser.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/log/log_manager.hpp>
#include <certreq/request/issuance_pipeline.hpp>

namespace certreq::cmd
{

CreateCommand::CreateCommand()
    : CreateCommand(std::cout)
{
}

CreateCommand::CreateCommand(std::ostream& out)
    : out_(out)
{
    parser_.add("help,h", "Print help message");
    parser_.add("filename,f", opt::Value(&filename_), "Certificate document to create a request for").setRequired();
    parser_.add("namespace,n", opt::Value(&namespace_), "Namespace used when the document names none")
        .setDefaultValue(std::string("default"));
    parser_.add("verbose,v", "Log every pipeline stage");
    parser_.add("log-level", opt::Value(&logLevel_), "Log level (error, warning, info, debug)");
}

void CreateCommand::execute(const std::vector<std::string_view>& args)
{
    parser_.parse(args);
    if (parser_.isUsed("help"))
    {
        parser_.help(out_, "certreq create");
        return;
    }
    parser_.validate();

    if (parser_.isUsed("verbose"))
    {
        log::LogManager::Instance().setLevel(log::Level::Debug);
    }
    else if (parser_.isUsed("log-level"))
    {
        log::LogManager::Instance().setLevel(log::levelFromString(logLevel_));
    }

    config::ConfigParser document;
    document.parse(filename_);

    auto manifest = api::Scheme::defaultScheme().decode(document);

    auto crt = api::toCertificate(manifest);
    if (crt.metadata.nameSpace.empty())
    {
        crt.metadata.nameSpace = namespace_;
    }

    log::info("creating request for certificate {}/{} ({})", crt.metadata.nameSpace, crt.metadata.name,
              api::apiVersionOf(manifest));

    crypto::CryptoContext ctx;
    request::IssuancePipeline pipeline(ctx);
    auto result = pipeline.run(crt);

    api::printCertificateRequest(out_, result, api::apiVersionOf(manifest));

    log::info("request {} created", result.identifier);
}

} // namespace certreq::cmd
