#pragma once
#include <istream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace certreq::config
{

/// @brief Reader for INI-style documents.
///
/// Sections are introduced by `[name]`, entries are `key = value` lines.
/// Lines starting with `#` or `;` and blank lines are skipped. A later entry
/// overrides an earlier one with the same key.
class ConfigParser final
{
public:
    using Section = std::map<std::string, std::string>;
    using Sections = std::map<std::string, Section>;

public:
    ConfigParser() = default;

    /// @throws utils::RuntimeError if the file cannot be read or a line is malformed.
    void parse(const std::string& filename);

    /// @param[in] name Source name used in error messages.
    void parse(std::istream& input, std::string_view name);

    const Sections& getSections() const noexcept;

    /// @brief Body of @p section, empty if the document has no such section.
    Section getSectionBody(const std::string& section) const;

    bool hasSection(const std::string& section) const;

private:
    Sections sections_;
};

/// @brief Value of @p key in @p section, or @p defaultValue.
std::string getValue(const ConfigParser::Section& section, const std::string& key,
                     const std::string& defaultValue = {});

/// @brief Comma separated list under @p key with each element trimmed; empty elements are dropped.
std::vector<std::string> getList(const ConfigParser::Section& section, const std::string& key);

/// @throws utils::RuntimeError unless the value is `true` or `false` (any case).
bool getBool(const ConfigParser::Section& section, const std::string& key, bool defaultValue = false);

/// @throws utils::RuntimeError unless the value is a decimal integer.
int getInt(const ConfigParser::Section& section, const std::string& key, int defaultValue = 0);

} // namespace certreq::config
