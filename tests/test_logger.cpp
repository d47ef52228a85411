#include "util/logger.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

namespace staticfs {

class LoggerTest : public ::testing::Test {
  protected:
    std::FILE* sink = nullptr;
    LogLevel saved = LogLevel::Info;

    void SetUp() override {
        sink = std::tmpfile();
        ASSERT_NE(sink, nullptr);
        saved = Logger::Instance().Level();
        Logger::Instance().SetStream(sink);
    }

    void TearDown() override {
        Logger::Instance().SetStream(nullptr);
        Logger::Instance().SetLevel(saved);
        std::fclose(sink);
    }

    std::string Captured() {
        std::fflush(sink);
        std::rewind(sink);
        std::string out;
        char buf[256];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), sink)) > 0) out.append(buf, n);
        return out;
    }
};

TEST_F(LoggerTest, LinesCarryLevelAndSource) {
    Logger::Instance().SetLevel(LogLevel::Debug);
    LogWarn("disk %s is %d%% full", "sda", 93);

    const std::string out = Captured();
    EXPECT_NE(out.find("WARN "), std::string::npos) << out;
    EXPECT_NE(out.find("[test_logger.cpp:"), std::string::npos) << out;
    EXPECT_NE(out.find("disk sda is 93% full\n"), std::string::npos) << out;
}

TEST_F(LoggerTest, LevelFiltersLowerSeverities) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LogDebug("hidden debug");
    LogInfo("hidden info");
    LogError("shown error");

    const std::string out = Captured();
    EXPECT_EQ(out.find("hidden"), std::string::npos) << out;
    EXPECT_NE(out.find("shown error"), std::string::npos) << out;
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::Instance().SetLevel(LogLevel::None);
    LogError("nothing");
    EXPECT_TRUE(Captured().empty());
}

TEST(LogLevelNameTest, NamesParseBack) {
    for (LogLevel lvl : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::None}) {
        LogLevel parsed{};
        ASSERT_TRUE(ParseLogLevel(LogLevelName(lvl), parsed));
        EXPECT_EQ(parsed, lvl);
    }
}

} // namespace staticfs
