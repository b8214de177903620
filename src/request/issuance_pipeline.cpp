#include <certreq/request/issuance_pipeline.hpp>
#include <certreq/request/request_assembler.hpp>
#include <certreq/crypto/asymm_key.hpp>
#include <certreq/crypto/exception.hpp>
#include <certreq/log/log_manager.hpp>

namespace certreq::request
{

using Stage = IssuancePipeline::Stage;

std::string_view toString(Stage stage)
{
    switch (stage)
    {
    case Stage::SpecLoaded:
        return "SpecLoaded";
    case Stage::NameComputed:
        return "NameComputed";
    case Stage::KeyGenerated:
        return "KeyGenerated";
    case Stage::KeyEncoded:
        return "KeyEncoded";
    case Stage::CSRBuilt:
        return "CSRBuilt";
    case Stage::CSRSigned:
        return "CSRSigned";
    case Stage::RequestAssembled:
        return "RequestAssembled";
    case Stage::Done:
        return "Done";
    case Stage::Failed:
        return "Failed";
    }
    return "Unknown";
}

IssuancePipeline::IssuancePipeline(const crypto::CryptoContext& ctx)
    : namer_(ctx)
    , generator_(ctx)
    , codec_(ctx)
    , csrBuilder_(ctx)
    , csrSigner_(ctx)
{
}

api::CertificateRequest IssuancePipeline::run(const api::CertificateManifest& manifest)
{
    return run(api::toCertificate(manifest));
}

api::CertificateRequest IssuancePipeline::run(const api::Certificate& crt)
{
    const auto& name = crt.metadata.name;

    stage_ = Stage::SpecLoaded;
    failedAfter_ = Stage::SpecLoaded;
    failure_.clear();
    failureReason_.clear();

    log::debug("{}: {}", name, toString(stage_));

    try
    {
        auto identifier = namer_.computeName(crt);
        advance(Stage::NameComputed, name);

        auto key = generator_.generate(crt.spec);
        advance(Stage::KeyGenerated, name);

        auto encoded = codec_.encode(key, crt.spec.keyEncoding);
        advance(Stage::KeyEncoded, name);

        auto csr = csrBuilder_.build(crt.spec);
        advance(Stage::CSRBuilt, name);

        auto signer = codec_.decode(encoded.view());
        encoded.clear();

        crypto::ThrowIfFalse(crypto::AsymmKey::isEqual(key, signer), Errc::KeyMismatch,
                             "decoded private key differs from the generated key");
        key.reset();

        auto signedCsr = csrSigner_.sign(csr, signer);
        advance(Stage::CSRSigned, name);

        auto result = RequestAssembler::assemble(crt, identifier, signedCsr);
        advance(Stage::RequestAssembled, name);

        advance(Stage::Done, name);
        return result;
    }
    catch (const std::system_error& e)
    {
        fail(e.code(), e.what(), name);
        throw;
    }
    catch (const std::exception& e)
    {
        fail(std::error_code(), e.what(), name);
        throw;
    }
}

void IssuancePipeline::advance(Stage next, std::string_view name)
{
    stage_ = next;
    log::debug("{}: {}", name, toString(stage_));
}

void IssuancePipeline::fail(std::error_code ec, std::string_view reason, std::string_view name)
{
    failedAfter_ = stage_;
    stage_ = Stage::Failed;
    failure_ = ec;
    failureReason_ = reason;

    log::error("{}: failed after {}: {}", name, toString(failedAfter_), reason);
}

} // namespace certreq::request
