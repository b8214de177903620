#pragma once
#include <cstddef>
#include <string_view>
#include <certreq/crypto/pointers.hpp>

namespace certreq::crypto
{
class CryptoContext;
} // namespace certreq::crypto

namespace certreq::crypto::akey
{

namespace rsa
{

KeyPtr generate(const CryptoContext& ctx, size_t bits);

} // namespace rsa

namespace ec
{

KeyPtr generate(const CryptoContext& ctx, std::string_view groupName);

} // namespace ec

} // namespace certreq::crypto::akey
