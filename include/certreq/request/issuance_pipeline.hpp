#pragma once
#include <string>
#include <string_view>
#include <system_error>

#include <certreq/api/manifest.hpp>
#include <certreq/api/types.hpp>
#include <certreq/crypto/key_codec.hpp>
#include <certreq/request/csr_builder.hpp>
#include <certreq/request/csr_signer.hpp>
#include <certreq/request/key_generator.hpp>
#include <certreq/request/request_namer.hpp>
#include <certreq/utils/noncopyable.hpp>

namespace certreq::request
{

/// @brief Turns a Certificate into a CertificateRequest in a single pass.
///
/// Stages run in order: SpecLoaded, NameComputed, KeyGenerated, KeyEncoded,
/// CSRBuilt, CSRSigned, RequestAssembled, Done. The CSR is signed with the
/// key decoded back from its encoded form, and that key must equal the
/// generated one. On any error the pipeline moves to Failed and rethrows;
/// the next run() starts again from SpecLoaded.
///
/// Key material lives only for the duration of run().
class IssuancePipeline final : utils::NonCopyable
{
public:
    enum class Stage
    {
        SpecLoaded,
        NameComputed,
        KeyGenerated,
        KeyEncoded,
        CSRBuilt,
        CSRSigned,
        RequestAssembled,
        Done,
        Failed,
    };

public:
    explicit IssuancePipeline(const crypto::CryptoContext& ctx);

    api::CertificateRequest run(const api::Certificate& crt);

    api::CertificateRequest run(const api::CertificateManifest& manifest);

    Stage stage() const noexcept
    {
        return stage_;
    }

    /// @brief Last stage reached before the failure, meaningful when stage() is Failed.
    Stage failedAfter() const noexcept
    {
        return failedAfter_;
    }

    const std::error_code& failure() const noexcept
    {
        return failure_;
    }

    const std::string& failureReason() const noexcept
    {
        return failureReason_;
    }

private:
    void advance(Stage next, std::string_view name);

    void fail(std::error_code ec, std::string_view reason, std::string_view name);

private:
    RequestNamer namer_;
    KeyGenerator generator_;
    crypto::KeyCodec codec_;
    CsrBuilder csrBuilder_;
    CsrSigner csrSigner_;

    Stage stage_{Stage::SpecLoaded};
    Stage failedAfter_{Stage::SpecLoaded};
    std::error_code failure_;
    std::string failureReason_;
};

std::string_view toString(IssuancePipeline::Stage stage);

} // namespace certreq::request
