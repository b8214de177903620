#include <certreq/errc.hpp>

namespace certreq
{

const char* ErrorCategory::name() const noexcept
{
    return "certreq";
}

std::string ErrorCategory::message(int value) const
{
    switch (static_cast<Errc>(value))
    {
    case Errc::InvalidSpec:
        return "invalid certificate spec";
    case Errc::UnsupportedAlgorithm:
        return "unsupported key algorithm";
    case Errc::UnsupportedEncoding:
        return "unsupported key encoding";
    case Errc::GenerationFailure:
        return "private key generation failed";
    case Errc::IncompatibleKeyAlgorithm:
        return "signature algorithm incompatible with key";
    case Errc::MalformedKeyData:
        return "malformed private key data";
    case Errc::HashingFailure:
        return "failed to hash certificate spec";
    case Errc::KeyMismatch:
        return "certificate request public key does not match signing key";
    }
    return "unknown error";
}

ErrorCategory& ErrorCategory::getInstance()
{
    static ErrorCategory instance;
    return instance;
}

std::error_code make_error_code(Errc e)
{
    return std::error_code(static_cast<int>(e), ErrorCategory::getInstance());
}

} // namespace certreq
