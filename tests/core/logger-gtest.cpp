#include "cpak/core/logger.h"
#include <gtest/gtest.h>
#include <sstream>

using namespace cpak;

class LoggerTest : public ::testing::Test
{
protected:
    std::ostringstream out_;
    std::ostringstream err_;
    LogLevel saved_level_ = LogLevel::WARNING;

    void
    SetUp() override
    {
        saved_level_ = Logger::get_level();
        Logger::set_output_stream(&out_);
        Logger::set_error_stream(&err_);
    }

    void
    TearDown() override
    {
        Logger::reset_streams();
        Logger::set_level(saved_level_);
    }
};

TEST_F(LoggerTest, GlobalLevelFilters)
{
    Logger::set_level(LogLevel::WARNING);
    LOGI("hidden");
    LOGW("shown");

    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("[WARN]  shown"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelByName)
{
    EXPECT_TRUE(Logger::set_level("debug"));
    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
    EXPECT_TRUE(Logger::set_level("error"));
    EXPECT_EQ(Logger::get_level(), LogLevel::ERROR);
    EXPECT_FALSE(Logger::set_level("chatty"));
    EXPECT_EQ(Logger::get_level(), LogLevel::ERROR);
}

TEST_F(LoggerTest, PartitionInheritsGlobalLevel)
{
    LogPartition partition("PACK");
    Logger::set_level(LogLevel::INFO);
    EXPECT_TRUE(partition.should_log(LogLevel::INFO));
    EXPECT_FALSE(partition.should_log(LogLevel::DEBUG));

    PLOGI(partition, "Packed ", 3);
    EXPECT_NE(out_.str().find("[PACK] Packed 3"), std::string::npos);
}

TEST_F(LoggerTest, PartitionOverridesGlobalLevel)
{
    Logger::set_level(LogLevel::ERROR);
    LogPartition partition("UNPACK", LogLevel::DEBUG);
    PLOGD(partition, "detail");
    EXPECT_NE(out_.str().find("[DEBUG] [UNPACK] detail"), std::string::npos);

    partition.set_level(LogLevel::NONE);
    PLOGE(partition, "silenced");
    EXPECT_EQ(err_.str().find("silenced"), std::string::npos);
}
