#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace certreq::test
{

/// Writes a Certificate document to a temporary file removed on destruction.
class DocumentFile final
{
public:
    explicit DocumentFile(const std::string& text)
        : path_(std::filesystem::temp_directory_path() /
                ("certreq_cli_" + std::to_string(::getpid()) + "_" + std::to_string(counter()++) + ".ini"))
    {
        std::ofstream file(path_);
        file << text;
    }

    ~DocumentFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    DocumentFile(const DocumentFile&) = delete;
    DocumentFile& operator=(const DocumentFile&) = delete;

    std::string path() const
    {
        return path_.string();
    }

private:
    static int& counter()
    {
        static int value{0};
        return value;
    }

    std::filesystem::path path_;
};

inline std::string webDocument(const std::string& metadataExtra = {})
{
    return "[manifest]\n"
           "apiVersion = cert-manager.io/v1\n"
           "kind = Certificate\n"
           "[metadata]\n"
           "name = web\n" +
           metadataExtra +
           "[labels]\n"
           "app = web\n"
           "[spec]\n"
           "commonName = example.com\n"
           "duration = 90d\n"
           "secretName = web-tls\n"
           "usages = server auth\n"
           "dnsNames = example.com\n"
           "[issuerRef]\n"
           "name = ca-issuer\n"
           "[privateKey]\n"
           "algorithm = ecdsa\n"
           "size = 256\n";
}

} // namespace certreq::test
