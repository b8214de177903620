#pragma once
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <tuple>

#include <certreq/cmd/command.hpp>
#include <certreq/utils/singleton.hpp>

namespace certreq::cmd
{

/// @brief Registry of sub-commands, filled at static initialization by REGISTER_COMMAND.
class CommandDispatcher final : public utils::Singleton<CommandDispatcher>
{
    using CommandPtr = std::unique_ptr<Command>;
    using CommandCreator = std::function<CommandPtr()>;
    using CommandMeta = std::tuple<std::string, CommandCreator>;
    using CommandMap = std::map<std::string, CommandMeta>;

public:
    CommandDispatcher() = default;
    ~CommandDispatcher() = default;

    /// @throws utils::RuntimeError for an unknown @p name.
    CommandPtr createCommand(const std::string& name) const;

    void printCommands(std::ostream& os) const;

public:
    class Registrar final
    {
    public:
        Registrar(const std::string& name, const std::string& description, const CommandCreator& creator);
    };

private:
    CommandMap commands_;
};

#define REGISTER_COMMAND(commandName, commandDesc, className)                                                   \
    const certreq::cmd::CommandDispatcher::Registrar className##Registrar(                                      \
        commandName, commandDesc, []() -> std::unique_ptr<certreq::cmd::Command> {                              \
            return std::make_unique<className>();                                                               \
        })

} // namespace certreq::cmd
