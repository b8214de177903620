#include <sstream>
#include <gtest/gtest.h>

#include <certreq/log/console.hpp>
#include <certreq/log/log_manager.hpp>
#include <certreq/utils/exception.hpp>

using namespace certreq;

namespace
{

class CapturingLogger final : public log::Logger
{
public:
    void write(log::Level level, std::string_view msg) override
    {
        messages.emplace_back(level, std::string(msg));
    }

    std::vector<std::pair<log::Level, std::string>> messages;
};

class LogManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        sink_ = std::make_shared<CapturingLogger>();
        manager().attach(log::Type::Custom, sink_);
        level_ = manager().getLevel();
    }

    void TearDown() override
    {
        manager().disable(log::Type::Custom);
        manager().setLevel(level_);
    }

    static log::LogManager& manager()
    {
        return log::LogManager::Instance();
    }

    std::shared_ptr<CapturingLogger> sink_;
    log::Level level_{log::Level::Warning};
};

} // namespace

TEST_F(LogManagerTest, FiltersByLevel)
{
    manager().setLevel(log::Level::Warning);

    log::error("{} failed", "web");
    log::debug("hidden");

    ASSERT_EQ(sink_->messages.size(), 1U);
    EXPECT_EQ(sink_->messages[0].first, log::Level::Error);
    EXPECT_EQ(sink_->messages[0].second, "web failed");
}

TEST_F(LogManagerTest, DebugLevelPassesEverything)
{
    manager().setLevel(log::Level::Debug);

    log::info("a");
    log::debug("b {}", 1);

    ASSERT_EQ(sink_->messages.size(), 2U);
    EXPECT_EQ(sink_->messages[1].second, "b 1");
}

TEST(LogLevelTest, FromString)
{
    EXPECT_EQ(log::levelFromString("DEBUG"), log::Level::Debug);
    EXPECT_EQ(log::levelFromString("warning"), log::Level::Warning);
    EXPECT_THROW(log::levelFromString("loud"), utils::RuntimeError);
}

TEST(ConsoleTest, WritesLevelAndMessage)
{
    std::ostringstream os;
    log::Console console(os, false);
    console.write(log::Level::Error, "boom");

    auto text = os.str();
    EXPECT_NE(text.find("[ERROR] boom\n"), std::string::npos) << text;
}
