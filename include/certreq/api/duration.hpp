#pragma once
#include <chrono>
#include <string>
#include <string_view>

namespace certreq::api
{

/// @brief Parses a duration such as `90d`, `2160h` or `1h30m15s`.
///
/// Accepted units are d, h, m and s. An empty string is a zero duration.
///
/// @throws CryptoException with Errc::InvalidSpec on malformed or negative text.
std::chrono::seconds parseDuration(std::string_view text);

/// @brief Formats @p value as `XhYmZs` (`2160h0m0s`); zero is `0s`.
std::string formatDuration(std::chrono::seconds value);

} // namespace certreq::api
