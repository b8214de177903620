#include <iostream>

#include <certreq/api/scheme.hpp>
#include <certreq/cmd/name_command.hpp>
#include <certreq/config/config_parser.hpp>
#include <certreq/crypto/crypto_context.hpp>
#include <certreq/request/request_namer.hpp>

namespace certreq::cmd
{

NameCommand::NameCommand()
    : NameCommand(std::cout)
{
}

NameCommand::NameCommand(std::ostream& out)
    : out_(out)
{
    parser_.add("help,h", "Print help message");
    parser_.add("filename,f", opt::Value(&filename_), "Certificate document").setRequired();
}

void NameCommand::execute(const std::vector<std::string_view>& args)
{
    parser_.parse(args);
    if (parser_.isUsed("help"))
    {
        parser_.help(out_, "certreq name");
        return;
    }
    parser_.validate();

    config::ConfigParser document;
    document.parse(filename_);

    auto crt = api::toCertificate(api::Scheme::defaultScheme().decode(document));

    crypto::CryptoContext ctx;
    request::RequestNamer namer(ctx);
    out_ << namer.computeName(crt) << std::endl;
}

} // namespace certreq::cmd
