#include "termsession/log.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

namespace termsession {

class LogTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        saved_level_ = log_level();
        set_log_stream(&output_);
    }

    void TearDown() override
    {
        set_log_stream(&std::cerr);
        set_log_level(saved_level_);
    }

    std::ostringstream output_;
    LogLevel saved_level_ = LogLevel::WARNING;
};

TEST_F(LogTest, DefaultLevelIsWarning)
{
    EXPECT_EQ(saved_level_, LogLevel::WARNING);
}

TEST_F(LogTest, MessagesBelowLevelAreDropped)
{
    set_log_level(LogLevel::WARNING);
    log_verbose("poll tick");
    log_info("session opened");
    EXPECT_EQ(output_.str(), "");

    log_error("restore failed");
    EXPECT_EQ(output_.str(), "[termsession] Error: restore failed\r\n");
}

TEST_F(LogTest, InfoLevelShowsInfo)
{
    set_log_level(LogLevel::INFO);
    EXPECT_EQ(log_level(), LogLevel::INFO);

    log_info("session opened");
    log_verbose("poll tick");
    EXPECT_EQ(output_.str(), "[termsession] Info: session opened\r\n");
}

TEST_F(LogTest, OffSilencesEverything)
{
    set_log_level(LogLevel::OFF);
    log_error("restore failed");
    log_message(LogLevel::OFF, "never shown");
    EXPECT_EQ(output_.str(), "");
}

TEST_F(LogTest, NullStreamSilencesEverything)
{
    set_log_level(LogLevel::VERBOSE);
    set_log_stream(nullptr);
    EXPECT_NO_THROW(log_error("restore failed"));
    EXPECT_EQ(output_.str(), "");
}

} // namespace termsession
