#include <certreq/request/request_assembler.hpp>

namespace certreq::request
{

api::CertificateRequest RequestAssembler::assemble(const api::Certificate& crt, const std::string& identifier,
                                                   const SignedCsr& csr)
{
    api::CertificateRequest req;

    req.identifier = identifier;

    auto& meta = req.metadata;
    meta.generateName = crt.metadata.name + "-";
    meta.nameSpace = crt.metadata.nameSpace;
    meta.labels = crt.metadata.labels;
    meta.annotations = crt.metadata.annotations;
    meta.annotations[std::string(api::kPrivateKeySecretNameAnnotation)] = crt.spec.secretName;
    meta.annotations[std::string(api::kCertificateNameAnnotation)] = crt.metadata.name;

    auto& spec = req.spec;
    spec.csrPEM = csr.pem;
    spec.duration = crt.spec.duration;
    spec.issuerRef = crt.spec.issuerRef;
    spec.isCA = crt.spec.isCA;
    spec.usages = crt.spec.usages;

    return req;
}

} // namespace certreq::request
