#pragma once
#include <algorithm>
#include <map>
#include <memory>
#include <string_view>

#include <certreq/log/logger.hpp>
#include <certreq/log/console.hpp>
#include <certreq/utils/singleton.hpp>
#include <certreq/utils/format.hpp>

namespace certreq::log
{

enum class Type
{
    Console,
    Custom
};

/// @brief Parses a level name (`error`, `warning`, `info`, `debug`, ...).
///
/// @throws utils::RuntimeError on an unknown name.
Level levelFromString(std::string_view name);

class LogManager final : public utils::Singleton<LogManager>
{
public:
    LogManager();

    ~LogManager() noexcept;

    void finalize();

    void setLevel(Level level);

    Level getLevel() const;

    void enable(Type type);

    void disable(Type type);

    template <typename... Args>
    void write(Level level, std::string_view str, Args&&... args)
    {
        if (level > maxLevel_ || loggers_.empty())
        {
            return;
        }

        auto msg = utils::format(str, std::forward<Args>(args)...);
        std::for_each(loggers_.begin(), loggers_.end(), [&](const auto& l) { l.second->write(level, msg); });
    }

    /// @brief Replaces the sink registered for @p type with @p logger.
    void attach(Type type, std::shared_ptr<Logger> logger);

private:
    Level maxLevel_;
    std::map<Type, std::shared_ptr<Logger>> loggers_;
};

template <typename... Args> void emergency(std::string_view str, Args&&... args)
{
    LogManager::Instance().write(Level::Emergency, str, std::forward<Args>(args)...);
}

template <typename... Args> void alert(std::string_view str, Args&&... args)
{
    LogManager::Instance().write(Level::Alert, str, std::forward<Args>(args)...);
}

template <typename... Args> void critical(std::string_view str, Args&&... args)
{
    LogManager::Instance().write(Level::Critical, str, std::forward<Args>(args)...);
}

template <typename... Args> void error(std::string_view str, Args&&... args)
{
    LogManager::Instance().write(Level::Error, str, std::forward<Args>(args)...);
}

template <typename... Args> void warning(std::string_view str, Args&&... args)
{
    LogManager::Instance().write(Level::Warning, str, std::forward<Args>(args)...);
}

template <typename... Args> void notice(std::string_view str, Args&&... args)
{
    LogManager::Instance().write(Level::Notice, str, std::forward<Args>(args)...);
}

template <typename... Args> void info(std::string_view str, Args&&... args)
{
    LogManager::Instance().write(Level::Info, str, std::forward<Args>(args)...);
}

template <typename... Args> void debug(std::string_view str, Args&&... args)
{
    LogManager::Instance().write(Level::Debug, str, std::forward<Args>(args)...);
}

} // namespace certreq::log
