#include <openssl/err.h>
#include <certreq/crypto/error_code.hpp>

namespace certreq::crypto
{

namespace
{

class OpenSslCategory final : public std::error_category
{
public:
    const char* name() const noexcept override
    {
        return "OpenSSL";
    }

    std::string message(int value) const override
    {
        const auto packed = static_cast<unsigned long>(value);
        const char* reason = ::ERR_reason_error_string(packed);
        if (!reason)
        {
            return "OpenSSL error " + std::to_string(ERR_GET_REASON(packed));
        }

        std::string result(reason);
        if (const char* lib = ::ERR_lib_error_string(packed))
        {
            result.append(" (").append(lib).append(")");
        }
        return result;
    }
};

} // namespace

const std::error_category& openSslCategory() noexcept
{
    static const OpenSslCategory category;
    return category;
}

std::error_code TranslateError(unsigned long error)
{
    if (ERR_SYSTEM_ERROR(error))
    {
        return {static_cast<int>(ERR_GET_REASON(error)), std::system_category()};
    }
    return {static_cast<int>(error), openSslCategory()};
}

std::error_code GetLastError()
{
    const auto error = ::ERR_get_error();
    return TranslateError(error != 0 ? error : ERR_PACK(ERR_LIB_NONE, 0, ERR_R_OPERATION_FAIL));
}

std::string GetLastErrorReason()
{
    const auto error = ::ERR_peek_last_error();
    ::ERR_clear_error();
    return error != 0 ? TranslateError(error).message() : std::string();
}

} // namespace certreq::crypto
