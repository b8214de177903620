#include <certreq/crypto/signature_algorithm.hpp>

namespace certreq::crypto
{

std::string_view digestName(SignatureAlgorithm alg)
{
    switch (alg)
    {
    case SignatureAlgorithm::SHA256WithRSA:
    case SignatureAlgorithm::ECDSAWithSHA256:
        return "SHA256";
    case SignatureAlgorithm::SHA384WithRSA:
    case SignatureAlgorithm::ECDSAWithSHA384:
        return "SHA384";
    case SignatureAlgorithm::SHA512WithRSA:
    case SignatureAlgorithm::ECDSAWithSHA512:
        return "SHA512";
    }
    return "";
}

std::string_view keyTypeName(SignatureAlgorithm alg)
{
    switch (alg)
    {
    case SignatureAlgorithm::SHA256WithRSA:
    case SignatureAlgorithm::SHA384WithRSA:
    case SignatureAlgorithm::SHA512WithRSA:
        return "RSA";
    case SignatureAlgorithm::ECDSAWithSHA256:
    case SignatureAlgorithm::ECDSAWithSHA384:
    case SignatureAlgorithm::ECDSAWithSHA512:
        return "EC";
    }
    return "";
}

std::string_view toString(SignatureAlgorithm alg)
{
    switch (alg)
    {
    case SignatureAlgorithm::SHA256WithRSA:
        return "SHA256-RSA";
    case SignatureAlgorithm::SHA384WithRSA:
        return "SHA384-RSA";
    case SignatureAlgorithm::SHA512WithRSA:
        return "SHA512-RSA";
    case SignatureAlgorithm::ECDSAWithSHA256:
        return "ECDSA-SHA256";
    case SignatureAlgorithm::ECDSAWithSHA384:
        return "ECDSA-SHA384";
    case SignatureAlgorithm::ECDSAWithSHA512:
        return "ECDSA-SHA512";
    }
    return "unknown";
}

} // namespace certreq::crypto
