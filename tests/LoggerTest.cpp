#ifndef ENABLE_LOG_DEBUG
#define ENABLE_LOG_DEBUG
#endif
#include "Logger.hpp"

#include <gtest/gtest.h>

#include <string>

#define MODULE "LoggerTest"

namespace {

struct Peer
{
    std::string peer_ = "10.0.0.7:5123";
    int str = 3;

    void report(uint32_t bytes)
    {
        LOG_WARN(peer_ << ": dropped " << bytes << " bytes, str=" << str);
    }
};

class LoggerTest : public ::testing::Test
{
protected:
    void SetUp() override { saved = Logger::getLevel(); }
    void TearDown() override { Logger::setLevel(saved); }

    Logger::Level saved = Logger::INFO;
};

} // namespace

TEST_F(LoggerTest, StreamsExpressionsWithMembersAndLocals)
{
    Logger::setLevel(Logger::DEBUG);
    Peer p;
    std::string msg = "hello";

    testing::internal::CaptureStderr();
    p.report(42);
    LOG_INFO("greeting " << msg << " #" << 7);
    LOG_DEBUG(p.peer_ << ": state " << "idle");
    std::string out = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find("[WARN:LoggerTest] 10.0.0.7:5123: dropped 42 bytes, str=3"), std::string::npos) << out;
    EXPECT_NE(out.find("[INFO:LoggerTest] greeting hello #7"), std::string::npos) << out;
    EXPECT_NE(out.find("[DEBUG:LoggerTest] 10.0.0.7:5123: state idle"), std::string::npos) << out;
}

TEST_F(LoggerTest, MessagesAboveLevelAreDropped)
{
    Logger::setLevel(Logger::WARN);

    testing::internal::CaptureStderr();
    LOG_INFO("not shown");
    LOG_ERROR("shown " << 1);
    std::string out = testing::internal::GetCapturedStderr();

    EXPECT_EQ(out.find("not shown"), std::string::npos);
    EXPECT_NE(out.find("[ERROR:LoggerTest] shown 1"), std::string::npos) << out;
}

TEST_F(LoggerTest, LevelNamesFromConfiguration)
{
    EXPECT_TRUE(Logger::setLevel(std::string("DEBUG")));
    EXPECT_EQ(Logger::getLevel(), Logger::DEBUG);
    EXPECT_FALSE(Logger::setLevel(std::string("LOUD")));
    EXPECT_EQ(Logger::getLevel(), Logger::DEBUG);
}
