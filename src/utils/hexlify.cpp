#include <certreq/utils/hexlify.hpp>
#include <certreq/utils/exception.hpp>

namespace certreq::utils
{

namespace
{

uint8_t char2digit(const char ch)
{
    if (ch >= '0' && ch <= '9')
    {
        return static_cast<uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f')
    {
        return static_cast<uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F')
    {
        return static_cast<uint8_t>(ch - 'A' + 10);
    }
    throw RuntimeError("invalid hexadecimal symbol");
}

} // namespace

std::string hexlify(std::span<const uint8_t> in)
{
    static const uint8_t kHexMap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string out;
    out.resize(in.size() * 2);

    for (size_t i = 0, j = 0; i < in.size() && j < out.size(); ++i)
    {
        out[j++] = kHexMap[(in[i] >> 4)];
        out[j++] = kHexMap[in[i] & 0xF];
    }

    return out;
}

std::vector<uint8_t> unhexlify(std::string_view in)
{
    ThrowIfFalse(in.size() % 2 == 0, "even string length required");

    std::vector<uint8_t> out;
    out.resize(in.size() / 2);

    for (size_t i = 0, j = 0; i < in.size() && j < out.size(); i += 2)
    {
        out[j++] = char2digit(in[i]) << 4 | char2digit(in[i + 1]);
    }

    return out;
}

} // namespace certreq::utils
