#pragma once
#include <string_view>

namespace certreq::log
{

enum class Level
{
    Emergency,
    Alert,
    Critical,
    Error,
    Warning,
    Notice,
    Info,
    Debug
};

std::string_view toString(Level level);

/// @brief Destination for already formatted messages.
class Logger
{
public:
    Logger() = default;
    virtual ~Logger() = default;

    virtual void write(Level level, std::string_view msg) = 0;
};

} // namespace certreq::log
