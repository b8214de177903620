/// @file
/// @brief Conversion of the OpenSSL error queue into std::error_code.

#pragma once
#include <string>
#include <system_error>

namespace certreq::crypto
{

/// @brief Category of packed OpenSSL error codes, named "OpenSSL".
const std::error_category& openSslCategory() noexcept;

/// @brief Maps a packed OpenSSL error to a std::error_code.
///
/// System errors reported through OpenSSL keep the system category.
std::error_code TranslateError(unsigned long error);

/// @brief Pops the oldest entry of the error queue, or ERR_R_OPERATION_FAIL if it is empty.
std::error_code GetLastError();

/// @brief Describes the newest queue entry and clears the queue.
/// @return The reason text, or an empty string if the queue was empty.
std::string GetLastErrorReason();

} // namespace certreq::crypto
