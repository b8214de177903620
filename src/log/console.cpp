#include <chrono>
#include <ctime>
#include <iostream>
#include <iomanip>
#include <certreq/log/console.hpp>

namespace certreq::log
{

namespace
{

constexpr std::string_view kResetColor{"\x1B[0m"};

std::string_view colorOf(Level level)
{
    switch (level)
    {
    case Level::Emergency:
    case Level::Alert:
    case Level::Critical:
    case Level::Error:
        return "\x1B[1;31m";
    case Level::Warning:
        return "\x1B[1;33m";
    case Level::Debug:
        return "\x1B[1;36m";
    default:
        return "\x1B[1;37m";
    }
}

} // namespace

Console::Console()
    : Console(std::cerr)
{
}

Console::Console(std::ostream& os, bool colored)
    : os_(os)
    , colored_(colored)
{
}

void Console::write(Level level, std::string_view msg)
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    os_ << std::put_time(&tm, "[%X %Y-%m-%d][");
    if (colored_)
    {
        os_ << colorOf(level) << toString(level) << kResetColor;
    }
    else
    {
        os_ << toString(level);
    }
    os_ << "] " << msg << std::endl;
}

} // namespace certreq::log
