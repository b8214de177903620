#pragma once
#include <string>

#include <certreq/api/types.hpp>
#include <certreq/request/csr_signer.hpp>

namespace certreq::request
{

class RequestAssembler final
{
public:
    /// @brief Combines @p crt, its identifier and signed request into a CertificateRequest.
    ///
    /// The record's generateName is the certificate name followed by '-'.
    /// Annotations are those of @p crt plus the private key secret name and
    /// certificate name bindings, which take precedence. Labels are copied.
    static api::CertificateRequest assemble(const api::Certificate& crt, const std::string& identifier,
                                            const SignedCsr& csr);
};

} // namespace certreq::request
