#include <cstdlib>
#include <iostream>

#include <certreq/cmd/command_dispatcher.hpp>
#include <certreq/log/log_manager.hpp>
#include <certreq/utils/string.hpp>

using namespace certreq;
using namespace certreq::cmd;

int main(int argc, char* argv[])
{
    log::LogManager::Instance().enable(log::Type::Console);

    try
    {
        std::vector<std::string_view> args(argv + 1, argv + argc);

        if (args.empty())
        {
            std::cerr << "Use '--help' to print commands" << std::endl;
            return EXIT_FAILURE;
        }
        else if (utils::equals(args.front(), "-h") || utils::equals(args.front(), "--help"))
        {
            std::cout << "Usage:\n  certreq <command> [options]\n\n";
            CommandDispatcher::Instance().printCommands(std::cout);
            return EXIT_SUCCESS;
        }

        auto command = CommandDispatcher::Instance().createCommand(argv[1]);
        args.erase(args.begin());
        command->execute(args);
    }
    catch (const std::system_error& e)
    {
        std::cerr << e.what() << " [" << e.code() << "]" << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
