#include <gtest/gtest.h>
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        log_path_ = (fs::temp_directory_path() / ("logger_test_" + std::to_string(::getpid()) + ".log")).string();
    }

    void TearDown() override
    {
        Logger::init("ERROR");
        std::error_code ec;
        fs::remove(log_path_, ec);
    }

    int countLines(const std::string &needle) const
    {
        std::ifstream in(log_path_);
        std::string line;
        int count = 0;
        while (std::getline(in, line))
        {
            if (line.find(needle) != std::string::npos)
                ++count;
        }
        return count;
    }

    std::string log_path_;
};

TEST_F(LoggerTest, RepeatedInitWritesEachLineOnce)
{
    Logger::init("INFO", log_path_);
    Logger::init("INFO", log_path_);

    Logger::info("written once");
    Logger::flush();

    EXPECT_EQ(countLines("written once"), 1);
}

TEST_F(LoggerTest, InitWithoutFileDetachesFileSink)
{
    Logger::init("INFO", log_path_);
    Logger::info("before detach");
    Logger::init("INFO");
    Logger::info("after detach");
    Logger::flush();

    EXPECT_EQ(countLines("before detach"), 1);
    EXPECT_EQ(countLines("after detach"), 0);
}

TEST_F(LoggerTest, LevelFiltersFileOutput)
{
    Logger::init("WARN", log_path_);
    Logger::info("quiet message");
    Logger::warn("loud message");
    Logger::flush();

    EXPECT_EQ(countLines("quiet message"), 0);
    EXPECT_EQ(countLines("loud message"), 1);
}

TEST_F(LoggerTest, LevelNamesAreValidated)
{
    EXPECT_TRUE(Logger::isValidLevel("DEBUG"));
    EXPECT_TRUE(Logger::isValidLevel("ERROR"));
    EXPECT_FALSE(Logger::isValidLevel("debug"));
    EXPECT_FALSE(Logger::isValidLevel("VERBOSE"));
}
