#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <plotscale/engine.hpp>
#include <plotscale/errors.hpp>
#include <plotscale/logger.hpp>
#include <string>
#include <vector>

using namespace plotscale;

// ─── format_message ──────────────────────────────────────────────────────────

TEST(LoggerFormat, ReplacesPlaceholdersInOrder)
{
    EXPECT_EQ(Logger::format_message("{} + {} = {}", 1, 2, 3), "1 + 2 = 3");
}

TEST(LoggerFormat, SurplusPlaceholdersKept)
{
    EXPECT_EQ(Logger::format_message("{} and {}", 7), "7 and {}");
}

TEST(LoggerFormat, SurplusArgumentsIgnored)
{
    EXPECT_EQ(Logger::format_message("only {}", "one", "two"), "only one");
}

TEST(LoggerFormat, SubstitutedTextNotRescanned)
{
    EXPECT_EQ(Logger::format_message("{} {}", std::string("{}"), 5), "{} 5");
}

TEST(LoggerFormat, Doubles)
{
    EXPECT_EQ(Logger::format_message("{}", 60.0), "60");
    EXPECT_EQ(Logger::format_message("{}", 0.1), "0.1");
    EXPECT_EQ(Logger::format_message("{}", -2.5f), "-2.5");
    EXPECT_EQ(Logger::format_message("{}", 1.0 / 3.0), "0.33333333333333331");
}

TEST(LoggerFormat, BoolAndNullString)
{
    const char* none = nullptr;
    EXPECT_EQ(Logger::format_message("{} {}", true, none), "true (null)");
}

TEST(LoggerLevels, Names)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

// ─── Sinks ───────────────────────────────────────────────────────────────────

class LoggerCapture : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    bool saw(LogLevel level, const std::string& category) const
    {
        for (const auto& e : entries_)
            if (e.level == level && e.category == category)
                return true;
        return false;
    }

    LogLevel                      saved_level_ = LogLevel::Info;
    std::vector<Logger::LogEntry> entries_;
};

TEST_F(LoggerCapture, LevelFilters)
{
    Logger::instance().set_level(LogLevel::Warning);
    PLOTSCALE_LOG_INFO("test", "dropped {}", 1);
    PLOTSCALE_LOG_WARN("test", "kept {}", 2);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warning);
    EXPECT_EQ(entries_[0].category, "test");
    EXPECT_EQ(entries_[0].message, "kept 2");
}

TEST_F(LoggerCapture, IsEnabled)
{
    Logger::instance().set_level(LogLevel::Error);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Warning));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Error));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Critical));
}

TEST_F(LoggerCapture, EngineLogsAtDebug)
{
    Logger::instance().set_level(LogLevel::Debug);
    NormalizationEngine         engine;
    std::vector<ProjectedPoint> data = {{0, 1}, {1, 2}};
    (void)engine.normalize_points(data, {10, 10});
    EXPECT_TRUE(saw(LogLevel::Debug, "engine"));
}

TEST_F(LoggerCapture, EngineQuietAtDefaultLevel)
{
    Logger::instance().set_level(LogLevel::Info);
    NormalizationEngine         engine;
    std::vector<ProjectedPoint> data = {{0, 1}, {1, 2}};
    (void)engine.normalize_bars(data, {10, 10});
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggerCapture, ErrorsAreLoggedBeforeThrowing)
{
    Logger::instance().set_level(LogLevel::Info);
    NormalizationEngine         engine;
    std::vector<ProjectedPoint> data = {{0, 1}};
    EXPECT_THROW((void)engine.normalize_points(data, {-5, 10}), NormalizeError);
    EXPECT_TRUE(saw(LogLevel::Error, "engine"));
}

TEST_F(LoggerCapture, SinkCount)
{
    EXPECT_EQ(Logger::instance().sink_count(), 1u);
    Logger::instance().add_sink(sinks::null_sink());
    EXPECT_EQ(Logger::instance().sink_count(), 2u);
}

TEST_F(LoggerCapture, FileSinkAppends)
{
    auto path = std::filesystem::temp_directory_path() / "plotscale_test_log.txt";
    std::filesystem::remove(path);

    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::file_sink(path.string()));
    PLOTSCALE_LOG_INFO("file", "hello {}", "world");

    std::ifstream f(path);
    std::string   contents((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("INFO [file] hello world"), std::string::npos);

    Logger::instance().clear_sinks();
    std::filesystem::remove(path);
}
