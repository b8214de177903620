#include <limits>
#include <openssl/pem.h>

#include <certreq/crypto/pem.hpp>
#include <certreq/crypto/bio.hpp>
#include <certreq/crypto/exception.hpp>

namespace certreq::crypto
{

std::string Pem::encode(std::string_view label, std::span<const uint8_t> der)
{
    ThrowIfTrue(der.size() > static_cast<size_t>(std::numeric_limits<long>::max()), "PEM body too large");

    std::string name(label);
    auto bio = BioTraits::createMemoryBuffer();
    ThrowIfFalse(0 < PEM_write_bio(bio, name.c_str(), "", der.data(), static_cast<long>(der.size())),
                 "failed to write PEM block");
    return BioTraits::getMemoryDataAsString(bio);
}

PemBlock Pem::decode(std::span<const uint8_t> text)
{
    auto bio = BioTraits::createMemoryReader(text.data(), text.size());

    char* name{nullptr};
    char* header{nullptr};
    unsigned char* data{nullptr};
    long length{0};

    const int ret = PEM_read_bio(bio, &name, &header, &data, &length);

    PemBlock block;
    if (ret > 0)
    {
        block.label.assign(name);
        block.der.assign(data, data + length);
    }

    OPENSSL_free(name);
    OPENSSL_free(header);
    OPENSSL_clear_free(data, length > 0 ? static_cast<size_t>(length) : 0U);

    ThrowIfFalse(ret > 0, "no PEM block found");
    return block;
}

PemBlock Pem::decode(std::string_view text)
{
    return decode(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

} // namespace certreq::crypto
