#include <sinew/core/log.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace sinew::core;
using namespace testing;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path = std::filesystem::temp_directory_path() / "sinew_log_tests" / "test.log";
        Logger& logger = Logger::instance();
        logger.set_console_enabled(false);
        logger.initialize(log_path.string(), false, LogLevel::Info);
    }

    void TearDown() override {
        Logger& logger = Logger::instance();
        logger.shutdown();
        logger.set_min_level(COMPILE_TIME_LOG_LEVEL);
        logger.enable_category(LogCategory::Combat, true);

        std::error_code ec;
        std::filesystem::remove_all(log_path.parent_path(), ec);
    }

    std::string read_log() {
        Logger::instance().flush();
        std::ifstream file(log_path);
        std::ostringstream contents;
        contents << file.rdbuf();
        return contents.str();
    }

    std::filesystem::path log_path;
};

TEST_F(LoggerTest, WritesFormattedEntries) {
    LOG_INFO(Anatomy, "Built {} parts for {}", 11, "humanoid");

    std::string contents = read_log();
    EXPECT_THAT(contents, HasSubstr("[INFO] [Anatomy] Built 11 parts"));
    EXPECT_THAT(contents, HasSubstr("Built 11 parts for humanoid"));
}

TEST_F(LoggerTest, MinimumLevelFilters) {
    Logger& logger = Logger::instance();
    logger.set_min_level(LogLevel::Error);
    EXPECT_EQ(logger.get_min_level(), LogLevel::Error);

    uint64_t before = logger.get_stats().total_logs;
    LOG_WARNING(Combat, "filtered warning");
    EXPECT_EQ(logger.get_stats().total_logs, before);

    LOG_ERROR(Combat, "kept error");
    EXPECT_EQ(logger.get_stats().total_logs, before + 1);

    std::string contents = read_log();
    EXPECT_THAT(contents, Not(HasSubstr("filtered warning")));
    EXPECT_THAT(contents, HasSubstr("[ERROR] [Combat] kept error"));
}

TEST_F(LoggerTest, CategoriesCanBeDisabled) {
    Logger& logger = Logger::instance();
    logger.enable_category(LogCategory::Combat, false);
    EXPECT_FALSE(logger.is_category_enabled(LogCategory::Combat));
    EXPECT_TRUE(logger.is_category_enabled(LogCategory::Equipment));

    LOG_WARNING(Combat, "muted combat line");
    LOG_WARNING(Equipment, "equipment line");

    std::string contents = read_log();
    EXPECT_THAT(contents, Not(HasSubstr("muted combat line")));
    EXPECT_THAT(contents, HasSubstr("equipment line"));
}

TEST_F(LoggerTest, ConsoleSwitchDoesNotAffectFile) {
    Logger& logger = Logger::instance();
    EXPECT_FALSE(logger.is_console_enabled());

    uint64_t console_before = logger.get_stats().console_writes;
    LOG_INFO(General, "file only");
    EXPECT_EQ(logger.get_stats().console_writes, console_before);
    EXPECT_THAT(read_log(), HasSubstr("file only"));
}

TEST(LoggerNamesTest, LevelAndCategoryNames) {
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Critical), "CRIT");
    EXPECT_STREQ(Logger::category_to_string(LogCategory::Anatomy), "Anatomy");
    EXPECT_STREQ(Logger::category_to_string(LogCategory::Performance), "Perf");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
