#include <array>
#include <openssl/evp.h>
#include <openssl/core_names.h>

#include <certreq/crypto/asymm_key.hpp>
#include <certreq/crypto/exception.hpp>

namespace certreq::crypto
{

KeyPtr AsymmKey::shallowCopy(Key* key)
{
    if (key)
    {
        crypto::ThrowIfFalse(0 < EVP_PKEY_up_ref(key));
        return KeyPtr{key};
    }
    return nullptr;
}

bool AsymmKey::isAlgorithm(const Key* key, std::string_view alg)
{
    return EVP_PKEY_is_a(key, std::string(alg).c_str());
}

bool AsymmKey::isEqual(const Key* a, const Key* b)
{
    return 0 < EVP_PKEY_eq(a, b);
}

int AsymmKey::bits(const Key* key)
{
    return EVP_PKEY_get_bits(key);
}

std::string AsymmKey::groupName(const Key* key)
{
    if (!isAlgorithm(key, "EC"))
    {
        return std::string();
    }

    std::array<char, 80> name{};
    size_t length{0};
    ThrowIfFalse(0 < EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME, name.data(), name.size(),
                                                    &length));
    return std::string(name.data(), length);
}

} // namespace certreq::crypto
