#include <cctype>
#include <limits>

#include <certreq/api/duration.hpp>
#include <certreq/crypto/exception.hpp>

namespace certreq::api
{

namespace
{

[[noreturn]] void invalidDuration(std::string_view text)
{
    throw crypto::CryptoException(make_error_code(Errc::InvalidSpec),
                                  "invalid duration '" + std::string(text) + "'");
}

int64_t unitSeconds(char unit)
{
    switch (unit)
    {
    case 'd':
        return 86400;
    case 'h':
        return 3600;
    case 'm':
        return 60;
    case 's':
        return 1;
    default:
        return 0;
    }
}

} // namespace

std::chrono::seconds parseDuration(std::string_view text)
{
    int64_t total{0};
    size_t pos{0};

    while (pos < text.size())
    {
        int64_t value{0};
        size_t digits{0};
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        {
            if (value > (std::numeric_limits<int64_t>::max() - 9) / 10)
            {
                invalidDuration(text);
            }
            value = value * 10 + (text[pos] - '0');
            ++pos;
            ++digits;
        }

        if (digits == 0 || pos == text.size())
        {
            invalidDuration(text);
        }

        auto multiplier = unitSeconds(text[pos++]);
        if (multiplier == 0 || value > (std::numeric_limits<int64_t>::max() - total) / multiplier)
        {
            invalidDuration(text);
        }
        total += value * multiplier;
    }

    return std::chrono::seconds(total);
}

std::string formatDuration(std::chrono::seconds value)
{
    auto total = value.count();
    if (total == 0)
    {
        return "0s";
    }

    std::string result;
    if (total < 0)
    {
        result.push_back('-');
        total = -total;
    }

    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    if (hours > 0)
    {
        result += std::to_string(hours) + "h" + std::to_string(minutes) + "m";
    }
    else if (minutes > 0)
    {
        result += std::to_string(minutes) + "m";
    }
    result += std::to_string(seconds) + "s";
    return result;
}

} // namespace certreq::api
