#include <limits>
#include <certreq/crypto/cert_name_builder.hpp>
#include <certreq/crypto/exception.hpp>

namespace certreq::crypto
{

namespace
{

X509NamePtr newName()
{
    X509NamePtr name{X509_NAME_new()};
    ThrowIfTrue(name == nullptr);
    return name;
}

} // namespace

CertNameBuilder::CertNameBuilder()
    : name_(newName())
{
}

CertNameBuilder& CertNameBuilder::addEntry(std::string_view field, std::string_view value)
{
    ThrowIfTrue(value.size() > static_cast<size_t>(std::numeric_limits<int>::max()), "name entry too long");

    const std::string attribute(field);
    ThrowIfFalse(X509_NAME_add_entry_by_txt(name_, attribute.c_str(), MBSTRING_UTF8,
                                            reinterpret_cast<const unsigned char*>(value.data()),
                                            static_cast<int>(value.size()), -1, 0),
                 "cannot add '" + attribute + "' to name");
    return *this;
}

CertNameBuilder& CertNameBuilder::addEntries(std::string_view field, const std::vector<std::string>& values)
{
    for (const auto& value : values)
    {
        addEntry(field, value);
    }
    return *this;
}

size_t CertNameBuilder::entryCount() const
{
    return static_cast<size_t>(X509_NAME_entry_count(name_));
}

X509NamePtr CertNameBuilder::build()
{
    auto result = newName();
    std::swap(result, name_);
    return result;
}

} // namespace certreq::crypto
