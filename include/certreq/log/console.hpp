#pragma once
#include <iosfwd>
#include <certreq/log/logger.hpp>

namespace certreq::log
{

/// @brief Writes messages with a timestamp and a coloured level tag.
///
/// Defaults to stderr, stdout is left to command output.
///
class Console final : public Logger
{
public:
    Console();

    explicit Console(std::ostream& os, bool colored = true);

    void write(Level level, std::string_view msg) override;

private:
    std::ostream& os_;
    bool colored_;
};

} // namespace certreq::log
