#pragma once
#include <ostream>
#include <string>

#include <certreq/cmd/command.hpp>
#include <certreq/opt/option_parser.hpp>

namespace certreq::cmd
{

/// @brief `create`: reads a Certificate document, runs the issuance pipeline
/// and writes the CertificateRequest manifest.
///
/// A document without a namespace gets the one from `--namespace`
/// (`default` unless given). `--verbose` wins over `--log-level`.
class CreateCommand final : public Command
{
public:
    CreateCommand();

    explicit CreateCommand(std::ostream& out);

    void execute(const std::vector<std::string_view>& args) override;

private:
    std::ostream& out_;
    opt::OptionParser parser_;
    std::string filename_;
    std::string namespace_;
    std::string logLevel_;
};

} // namespace certreq::cmd
