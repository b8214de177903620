#pragma once
#include <string>
#include <string_view>
#include <certreq/crypto/pointers.hpp>

namespace certreq::crypto
{

class AsymmKey
{
public:
    static KeyPtr shallowCopy(Key* key);

    static bool isAlgorithm(const Key* key, std::string_view alg);

    static bool isEqual(const Key* a, const Key* b);

    static int bits(const Key* key);

    /// @brief Curve name of an EC key, empty for other key types.
    static std::string groupName(const Key* key);
};

} // namespace certreq::crypto
