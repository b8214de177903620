#include <limits>
#include <vector>

#include <openssl/evp.h>

#include <certreq/api/printer.hpp>
#include <certreq/api/duration.hpp>
#include <certreq/api/manifest.hpp>
#include <certreq/crypto/exception.hpp>

using json = nlohmann::json;

namespace certreq::api
{

namespace
{

std::string base64(std::string_view data)
{
    crypto::ThrowIfTrue(data.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3),
                        "data too large");

    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                 static_cast<int>(data.size()));
    crypto::ThrowIfTrue(length < 0);
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(length));
}

void setIfNotEmpty(json& object, const char* key, const std::string& value)
{
    if (!value.empty())
    {
        object[key] = value;
    }
}

void setIfNotEmpty(json& object, const char* key, const StringMap& values)
{
    if (!values.empty())
    {
        object[key] = values;
    }
}

} // namespace

json toManifest(const CertificateRequest& request, std::string_view apiVersion)
{
    const auto& meta = request.metadata;
    const auto& spec = request.spec;

    json metadata = json::object();
    setIfNotEmpty(metadata, "annotations", meta.annotations);
    setIfNotEmpty(metadata, "generateName", meta.generateName);
    setIfNotEmpty(metadata, "labels", meta.labels);
    setIfNotEmpty(metadata, "name", meta.name);
    setIfNotEmpty(metadata, "namespace", meta.nameSpace);

    json issuerRef = {{"name", spec.issuerRef.name}};
    setIfNotEmpty(issuerRef, "kind", spec.issuerRef.kind);
    setIfNotEmpty(issuerRef, "group", spec.issuerRef.group);

    json body = {{"issuerRef", std::move(issuerRef)}, {"request", base64(spec.csrPEM)}};
    if (spec.duration.count() != 0)
    {
        body["duration"] = formatDuration(spec.duration);
    }
    if (spec.isCA)
    {
        body["isCA"] = true;
    }
    if (!spec.usages.empty())
    {
        auto& usages = body["usages"] = json::array();
        for (auto usage : spec.usages)
        {
            usages.push_back(toString(usage));
        }
    }

    return json{
        {"apiVersion", apiVersion},
        {"kind", kCertificateRequestKind},
        {"metadata", std::move(metadata)},
        {"spec", std::move(body)},
    };
}

void printCertificateRequest(std::ostream& os, const CertificateRequest& request, std::string_view apiVersion)
{
    os << toManifest(request, apiVersion).dump(2) << "\n";
}

} // namespace certreq::api
