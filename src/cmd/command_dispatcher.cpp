#include <iomanip>
#include <stdexcept>

#include <certreq/cmd/command_dispatcher.hpp>
#include <certreq/utils/exception.hpp>

namespace certreq::cmd
{

CommandDispatcher::CommandPtr CommandDispatcher::createCommand(const std::string& name) const
{
    auto command = commands_.find(name);
    utils::ThrowIfTrue(command == commands_.end(), "unknown command '" + name + "'");
    return std::get<CommandCreator>(command->second)();
}

void CommandDispatcher::printCommands(std::ostream& os) const
{
    os << "Commands:\n";
    for (const auto& [name, meta] : commands_)
    {
        os << "  " << std::left << std::setw(12) << name << std::get<std::string>(meta) << "\n";
    }
}

CommandDispatcher::Registrar::Registrar(const std::string& name, const std::string& description,
                                        const CommandCreator& creator)
{
    auto& commands = CommandDispatcher::Instance().commands_;
    if (commands.find(name) != commands.end())
    {
        throw std::logic_error("duplicated command '" + name + "'");
    }
    commands.emplace(name, std::make_tuple(description, creator));
}

} // namespace certreq::cmd
