#include <gtest/gtest.h>

#include "llmb/log.hpp"

#include <string>
#include <utility>
#include <vector>

namespace
{

class LogTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        previous_ = llmb::log::threshold();
        llmb::log::setSink([this](llmb::log::Level level, const std::string &message) {
            captured_.emplace_back(level, message);
        });
    }

    void TearDown() override
    {
        llmb::log::setSink({});
        llmb::log::setThreshold(previous_);
    }

    llmb::log::Level previous_ = llmb::log::Level::Info;
    std::vector<std::pair<llmb::log::Level, std::string>> captured_;
};

} // namespace

TEST_F(LogTest, ForwardsMessagesToSink)
{
    llmb::log::setThreshold(llmb::log::Level::Info);
    llmb::log::info("building");
    llmb::log::error("failed");

    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[0].first, llmb::log::Level::Info);
    EXPECT_EQ(captured_[0].second, "building");
    EXPECT_EQ(captured_[1].first, llmb::log::Level::Error);
}

TEST_F(LogTest, DropsMessagesBelowThreshold)
{
    llmb::log::setThreshold(llmb::log::Level::Warning);
    llmb::log::debug("noise");
    llmb::log::info("noise");
    llmb::log::warning("kept");

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].second, "kept");
}

TEST(LogLevel, ParsesNamesCaseInsensitively)
{
    EXPECT_EQ(llmb::log::parseLevel("DEBUG").value(), llmb::log::Level::Debug);
    EXPECT_EQ(llmb::log::parseLevel("warn").value(), llmb::log::Level::Warning);
    EXPECT_EQ(llmb::log::parseLevel("Error").value(), llmb::log::Level::Error);
    EXPECT_FALSE(llmb::log::parseLevel("verbose").has_value());
    EXPECT_STREQ(llmb::log::levelName(llmb::log::Level::Warning), "warning");
}
