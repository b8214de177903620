/// @file
/// @brief General exception type for cryptographic and request errors.

#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <stdexcept>

#include <certreq/errc.hpp>
#include <certreq/crypto/error_code.hpp>

namespace certreq::crypto
{

/// @brief Main class for crypto exceptions.
class CryptoException final : public std::system_error
{
public:
    /// @brief Constructor.
    ///
    /// @param[in] ec Error code.
    ///
    explicit CryptoException(std::error_code ec)
        : std::system_error(ec)
    {
    }

    /// @brief Constructor.
    ///
    /// @param[in] ec Error code.
    /// @param[in] what Error message.
    ///
    CryptoException(std::error_code ec, std::string_view what)
        : std::system_error(ec, std::string(what))
    {
    }
};

/// @brief Throws an exception if @p expression is true.
///
/// @param[in] expression Result of the expression to check.
///
inline void ThrowIfTrue(bool expression)
{
    if (expression)
    {
        throw CryptoException(GetLastError());
    }
}

/// @brief Throws an exception if @p expression is true.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Additional message.
///
inline void ThrowIfTrue(bool expression, std::string_view message)
{
    if (expression)
    {
        throw CryptoException(GetLastError(), message);
    }
}

/// @brief Throws an exception if @p expression is false.
///
/// @param[in] expression Result of the expression to check.
///
inline void ThrowIfFalse(bool expression)
{
    if (!expression)
    {
        throw CryptoException(GetLastError());
    }
}

/// @brief Throws an exception if @p expression is false.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Additional message.
///
inline void ThrowIfFalse(bool expression, std::string_view message)
{
    if (!expression)
    {
        throw CryptoException(GetLastError(), message);
    }
}

/// @brief Throws a #certreq::Errc exception, appending the queued OpenSSL reason if any.
///
/// @param[in] code Taxonomy value to report.
/// @param[in] message Context message.
///
[[noreturn]] inline void ThrowError(Errc code, std::string_view message)
{
    std::string what(message);
    auto reason = GetLastErrorReason();
    if (!reason.empty())
    {
        what += ": " + reason;
    }
    throw CryptoException(make_error_code(code), what);
}

/// @brief Throws a #certreq::Errc exception if @p expression is true.
inline void ThrowIfTrue(bool expression, Errc code, std::string_view message)
{
    if (expression)
    {
        ThrowError(code, message);
    }
}

/// @brief Throws a #certreq::Errc exception if @p expression is false.
inline void ThrowIfFalse(bool expression, Errc code, std::string_view message)
{
    if (!expression)
    {
        ThrowError(code, message);
    }
}

} // namespace certreq::crypto
