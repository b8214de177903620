#include <charconv>
#include <fstream>

#include <certreq/config/config_parser.hpp>
#include <certreq/utils/exception.hpp>
#include <certreq/utils/format.hpp>
#include <certreq/utils/string.hpp>

namespace certreq::config
{

void ConfigParser::parse(const std::string& filename)
{
    std::ifstream file(filename);
    utils::ThrowIfFalse(file.is_open(), utils::format("{}: failed to open file", filename));
    parse(file, filename);
}

void ConfigParser::parse(std::istream& input, std::string_view name)
{
    std::string line;
    std::string current;
    size_t lineNumber{0};

    while (std::getline(input, line))
    {
        ++lineNumber;
        utils::trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';')
        {
            continue;
        }

        if (line.front() == '[')
        {
            utils::ThrowIfTrue(line.back() != ']' || line.size() < 3,
                               utils::format("{}:{}: malformed section header", name, lineNumber));
            current = line.substr(1, line.size() - 2);
            utils::trim(current);
            sections_[current];
            continue;
        }

        auto delimiter = line.find('=');
        utils::ThrowIfTrue(delimiter == std::string::npos,
                           utils::format("{}:{}: expected 'key = value'", name, lineNumber));
        utils::ThrowIfTrue(current.empty(), utils::format("{}:{}: entry outside of a section", name, lineNumber));

        std::string key = line.substr(0, delimiter);
        std::string value = line.substr(delimiter + 1);
        utils::trim(key);
        utils::trim(value);

        utils::ThrowIfTrue(key.empty(), utils::format("{}:{}: empty key", name, lineNumber));
        sections_[current][key] = value;
    }

    utils::ThrowIfTrue(input.bad(), utils::format("{}: read error", name));
}

const ConfigParser::Sections& ConfigParser::getSections() const noexcept
{
    return sections_;
}

ConfigParser::Section ConfigParser::getSectionBody(const std::string& section) const
{
    auto found = sections_.find(section);
    if (found != sections_.end())
    {
        return found->second;
    }
    return Section();
}

bool ConfigParser::hasSection(const std::string& section) const
{
    return sections_.find(section) != sections_.end();
}

std::string getValue(const ConfigParser::Section& section, const std::string& key, const std::string& defaultValue)
{
    auto found = section.find(key);
    return found != section.end() ? found->second : defaultValue;
}

std::vector<std::string> getList(const ConfigParser::Section& section, const std::string& key)
{
    std::vector<std::string> result;

    auto found = section.find(key);
    if (found == section.end() || found->second.empty())
    {
        return result;
    }

    for (auto& item : utils::split(found->second, ","))
    {
        utils::trim(item);
        if (!item.empty())
        {
            result.push_back(std::move(item));
        }
    }
    return result;
}

bool getBool(const ConfigParser::Section& section, const std::string& key, bool defaultValue)
{
    auto found = section.find(key);
    if (found == section.end() || found->second.empty())
    {
        return defaultValue;
    }

    if (utils::iequals(found->second, "true"))
    {
        return true;
    }
    utils::ThrowIfFalse(utils::iequals(found->second, "false"),
                        utils::format("'{}': expected true or false, got '{}'", key, found->second));
    return false;
}

int getInt(const ConfigParser::Section& section, const std::string& key, int defaultValue)
{
    auto found = section.find(key);
    if (found == section.end() || found->second.empty())
    {
        return defaultValue;
    }

    const auto& text = found->second;
    int value{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    utils::ThrowIfTrue(ec != std::errc() || ptr != text.data() + text.size(),
                       utils::format("'{}': expected an integer, got '{}'", key, text));
    return value;
}

} // namespace certreq::config
