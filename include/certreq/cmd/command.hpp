#pragma once
#include <string_view>
#include <vector>
#include <certreq/utils/noncopyable.hpp>

namespace certreq::cmd
{

class Command : public utils::NonCopyable
{
public:
    Command() = default;

    virtual ~Command() = default;

    virtual void execute(const std::vector<std::string_view>& args) = 0;
};

} // namespace certreq::cmd
