#include <string>
#include <certreq/log/log_manager.hpp>
#include <certreq/utils/exception.hpp>
#include <certreq/utils/string.hpp>

namespace certreq::log
{

std::string_view toString(Level level)
{
    switch (level)
    {
    case Level::Emergency:
        return "EMERG";
    case Level::Alert:
        return "ALERT";
    case Level::Critical:
        return "CRITL";
    case Level::Error:
        return "ERROR";
    case Level::Warning:
        return "WARNG";
    case Level::Notice:
        return "NOTIC";
    case Level::Info:
        return "INFOR";
    case Level::Debug:
        return "DEBUG";
    }
    return "UNKWN";
}

Level levelFromString(std::string_view name)
{
    static const std::pair<std::string_view, Level> kLevels[] = {
        {"emergency", Level::Emergency}, {"alert", Level::Alert}, {"critical", Level::Critical},
        {"error", Level::Error},         {"warning", Level::Warning}, {"notice", Level::Notice},
        {"info", Level::Info},           {"debug", Level::Debug},
    };

    for (const auto& [text, level] : kLevels)
    {
        if (utils::iequals(text, name))
        {
            return level;
        }
    }
    throw utils::RuntimeError("unknown log level: " + std::string(name));
}

LogManager::LogManager()
    : maxLevel_{Level::Warning}
{
}

LogManager::~LogManager() noexcept
{
    finalize();
}

void LogManager::finalize()
{
    loggers_.clear();
}

void LogManager::setLevel(Level level)
{
    maxLevel_ = level;
}

Level LogManager::getLevel() const
{
    return maxLevel_;
}

void LogManager::enable(Type type)
{
    utils::ThrowIfTrue(type != Type::Console, "only the console sink can be enabled without an instance");
    loggers_[type] = std::make_shared<Console>();
}

void LogManager::disable(Type type)
{
    loggers_.erase(type);
}

void LogManager::attach(Type type, std::shared_ptr<Logger> logger)
{
    loggers_[type] = std::move(logger);
}

} // namespace certreq::log
