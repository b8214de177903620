#pragma once
#include <ostream>
#include <string_view>

#include <nlohmann/json.hpp>

#include <certreq/api/types.hpp>

namespace certreq::api
{

/// @brief CertificateRequest manifest for @p request.
///
/// The CSR PEM is stored base64 encoded under `spec.request`, the way
/// byte fields are rendered in Kubernetes manifests. Empty optional fields
/// are omitted.
nlohmann::json toManifest(const CertificateRequest& request, std::string_view apiVersion);

/// @brief Writes the manifest of @p request as indented JSON, which kubectl accepts as YAML.
void printCertificateRequest(std::ostream& os, const CertificateRequest& request, std::string_view apiVersion);

} // namespace certreq::api
