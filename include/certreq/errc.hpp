/// @file
/// @brief Failure taxonomy of the issuance-request pipeline.

#pragma once
#include <string>
#include <system_error>

namespace certreq
{

/// @brief Reasons an issuance request cannot be produced.
///
/// Every value is terminal for the invocation that raised it.
enum class Errc
{
    InvalidSpec = 1,
    UnsupportedAlgorithm,
    UnsupportedEncoding,
    GenerationFailure,
    IncompatibleKeyAlgorithm,
    MalformedKeyData,
    HashingFailure,
    KeyMismatch,
};

/// @brief Error category for #Errc values.
class ErrorCategory final : public std::error_category
{
public:
    const char* name() const noexcept override;

    std::string message(int value) const override;

    static ErrorCategory& getInstance();

private:
    ErrorCategory() = default;
    ~ErrorCategory() = default;
};

std::error_code make_error_code(Errc e);

} // namespace certreq

namespace std
{

template <>
struct is_error_code_enum<certreq::Errc> : true_type
{
};

} // namespace std
