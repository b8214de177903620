#pragma once

#include <algorithm>
#include <any>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <certreq/utils/exception.hpp>

namespace certreq::opt
{

namespace detail
{

class ValueSemantic
{
public:
    virtual ~ValueSemantic() = default;

    virtual void parse(std::any& value, std::string_view arg) const = 0;

    virtual void notify(const std::any& value) const = 0;

    virtual bool takesArgument() const = 0;
};

class FlagValue final : public ValueSemantic
{
public:
    void parse(std::any&, std::string_view) const override
    {
    }

    void notify(const std::any&) const override
    {
    }

    bool takesArgument() const override
    {
        return false;
    }
};

template <typename T>
class TypedValue final : public ValueSemantic
{
public:
    explicit TypedValue(T* target)
        : target_(target)
    {
    }

    void parse(std::any& value, std::string_view arg) const override
    {
        if constexpr (std::is_same_v<T, std::string>)
        {
            value = std::string(arg);
        }
        else
        {
            std::istringstream iss{std::string(arg)};
            T typed{};
            utils::ThrowIfFalse(static_cast<bool>(iss >> typed) && iss.eof(),
                                "could not parse value '" + std::string(arg) + "'");
            value = std::move(typed);
        }
    }

    void notify(const std::any& value) const override
    {
        const T* typed = std::any_cast<T>(&value);
        if (target_ && typed)
        {
            *target_ = *typed;
        }
    }

    bool takesArgument() const override
    {
        return true;
    }

private:
    T* target_;
};

inline constexpr std::string_view kShortPrefix = "-";
inline constexpr std::string_view kLongPrefix = "--";

} // namespace detail

template <class T>
std::shared_ptr<detail::TypedValue<T>> Value(T* target = nullptr)
{
    return std::make_shared<detail::TypedValue<T>>(target);
}

class OptionParser;

class Option final
{
    friend class OptionParser;

public:
    /// @param[in] names Long name, optionally followed by a comma and a short alias ("filename,f").
    Option(std::string names, std::shared_ptr<detail::ValueSemantic> semantic, std::string description)
        : description_(std::move(description))
        , semantic_(std::move(semantic))
    {
        auto comma = names.find(',');
        name_ = names.substr(0, comma);
        if (comma != std::string::npos)
        {
            auto alias = names.substr(comma + 1);
            alias.erase(std::remove(alias.begin(), alias.end(), ' '), alias.end());
            utils::ThrowIfTrue(alias.empty(), "invalid option name '" + names + "'");
            alias_ = std::move(alias);
        }
    }

    Option& setRequired()
    {
        required_ = true;
        return *this;
    }

    template <typename T>
    Option& setDefaultValue(T value)
    {
        value_ = std::move(value);
        return *this;
    }

private:
    void consume(std::optional<std::string_view> arg)
    {
        utils::ThrowIfTrue(used_, "option '" + name_ + "' given more than once");
        used_ = true;

        if (semantic_->takesArgument())
        {
            utils::ThrowIfFalse(arg.has_value(), "option '" + name_ + "' requires a value");
            semantic_->parse(value_, *arg);
        }
    }

    void validate() const
    {
        utils::ThrowIfTrue(required_ && !used_, "option '" + name_ + "' must be specified");
        semantic_->notify(value_);
    }

private:
    std::string name_;
    std::optional<std::string> alias_;
    std::string description_;
    std::shared_ptr<detail::ValueSemantic> semantic_;
    std::any value_;
    bool required_{false};
    bool used_{false};
};

/// @brief Parser for `--name value`, `--name=value`, `-alias value` and flag arguments.
///
/// Values are written to their bound targets only after every argument
/// was consumed and every required option was seen.
class OptionParser final
{
public:
    OptionParser() = default;

    OptionParser(const OptionParser&) = delete;
    OptionParser& operator=(const OptionParser&) = delete;

    template <typename T>
    Option& add(std::string names, std::shared_ptr<detail::TypedValue<T>> value, std::string description)
    {
        return insert(Option(std::move(names), std::move(value), std::move(description)));
    }

    Option& add(std::string names, std::string description)
    {
        return insert(Option(std::move(names), std::make_shared<detail::FlagValue>(), std::move(description)));
    }

    void parse(int argc, char* argv[])
    {
        parse(std::vector<std::string_view>(argv + (argc > 0 ? 1 : 0), argv + argc));
    }

    void parse(const std::vector<std::string_view>& args)
    {
        for (size_t i = 0; i < args.size(); ++i)
        {
            auto arg = args[i];
            std::optional<std::string_view> inlineValue;

            if (startsWith(arg, detail::kLongPrefix))
            {
                arg.remove_prefix(detail::kLongPrefix.size());
                auto assign = arg.find('=');
                if (assign != std::string_view::npos)
                {
                    inlineValue = arg.substr(assign + 1);
                    arg = arg.substr(0, assign);
                }
            }
            else if (startsWith(arg, detail::kShortPrefix) && arg.size() > 1)
            {
                arg.remove_prefix(detail::kShortPrefix.size());
            }
            else
            {
                throw utils::RuntimeError("unexpected argument '" + std::string(arg) + "'");
            }

            auto& option = find(arg);
            if (option.semantic_->takesArgument() && !inlineValue && i + 1 < args.size())
            {
                inlineValue = args[++i];
            }
            utils::ThrowIfTrue(inlineValue && !option.semantic_->takesArgument(),
                               "option '" + option.name_ + "' does not take a value");
            option.consume(inlineValue);
        }
        parsed_ = true;
    }

    /// @brief Checks required options and stores values into bound targets.
    void validate() const
    {
        for (const auto& option : options_)
        {
            option.validate();
        }
    }

    bool isUsed(std::string_view name) const
    {
        return find(name).used_;
    }

    template <typename T = std::string>
    T get(std::string_view name) const
    {
        utils::ThrowIfFalse(parsed_, "attempt to get value before parsing");
        const auto& option = find(name);
        utils::ThrowIfFalse(option.value_.has_value(), "no value for option '" + option.name_ + "'");
        return std::any_cast<T>(option.value_);
    }

    void help(std::ostream& os, std::string_view usageName = "") const
    {
        os << "Usage:\n  " << usageName;
        for (const auto& option : options_)
        {
            os << (option.required_ ? " " : " [ ") << detail::kLongPrefix << option.name_
               << (option.semantic_->takesArgument() ? " arg" : "") << (option.required_ ? "" : " ]");
        }
        os << "\n\nAllowed options:\n";

        for (const auto& option : options_)
        {
            std::string info = "  " + std::string(detail::kLongPrefix) + option.name_;
            if (option.alias_)
            {
                info += " [ " + std::string(detail::kShortPrefix) + *option.alias_ + " ]";
            }
            if (option.semantic_->takesArgument())
            {
                info += " arg";
            }
            os << info << std::string(info.size() < 30 ? 30 - info.size() : 1, ' ') << option.description_ << "\n";
        }
    }

private:
    static bool startsWith(std::string_view str, std::string_view prefix)
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    Option& insert(Option&& option)
    {
        auto it = options_.insert(options_.end(), std::move(option));
        index_.insert_or_assign(it->name_, it);
        if (it->alias_)
        {
            index_.insert_or_assign(*it->alias_, it);
        }
        return *it;
    }

    Option& find(std::string_view name) const
    {
        auto it = index_.find(name);
        utils::ThrowIfTrue(it == index_.end(), "unknown option '" + std::string(name) + "'");
        return *it->second;
    }

private:
    std::list<Option> options_;
    std::map<std::string, std::list<Option>::iterator, std::less<>> index_;
    bool parsed_{false};
};

} // namespace certreq::opt
