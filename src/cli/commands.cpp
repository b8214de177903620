#include <certreq/cmd/command_dispatcher.hpp>
#include <certreq/cmd/create_command.hpp>
#include <certreq/cmd/name_command.hpp>

namespace certreq::cmd
{

REGISTER_COMMAND("create", "Create a CertificateRequest for a Certificate document", CreateCommand);

REGISTER_COMMAND("name", "Print the request identifier of a Certificate document", NameCommand);

} // namespace certreq::cmd
