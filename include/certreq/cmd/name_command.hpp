#pragma once
#include <ostream>
#include <string>

#include <certreq/cmd/command.hpp>
#include <certreq/opt/option_parser.hpp>

namespace certreq::cmd
{

/// @brief `name`: writes the request identifier of a Certificate document, nothing else.
class NameCommand final : public Command
{
public:
    NameCommand();

    explicit NameCommand(std::ostream& out);

    void execute(const std::vector<std::string_view>& args) override;

private:
    std::ostream& out_;
    opt::OptionParser parser_;
    std::string filename_;
};

} // namespace certreq::cmd
