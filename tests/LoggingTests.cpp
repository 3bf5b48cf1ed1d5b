#include <gtest/gtest.h>

#include "Logging.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace XmlJsonBridge;

namespace {

class LoggingTest : public ::testing::Test {
protected:
  void SetUp() override {
    set_log_level(LogLevel::Debug);
    set_log_sink([this](LogLevel level, const std::string &msg) {
      lines.emplace_back(level, msg);
    });
  }
  void TearDown() override {
    set_log_sink(nullptr);
    set_log_level(LogLevel::Warn);
  }

  std::vector<std::pair<LogLevel, std::string>> lines;
};

} // namespace

TEST_F(LoggingTest, SinkReceivesMessages) {
  log_debug("d");
  log_error("e");
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].first, LogLevel::Debug);
  EXPECT_EQ(lines[1].second, "e");
}

TEST_F(LoggingTest, LevelFilters) {
  set_log_level(LogLevel::Warn);
  log_debug("hidden");
  log_info("hidden");
  log_warn("shown");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].second, "shown");
  EXPECT_FALSE(log_enabled(LogLevel::Info));
  EXPECT_TRUE(log_enabled(LogLevel::Error));
}

TEST_F(LoggingTest, OffSilencesEverything) {
  set_log_level(LogLevel::Off);
  log_error("hidden");
  EXPECT_TRUE(lines.empty());
}

TEST(Logging, LevelNames) {
  EXPECT_STREQ(log_level_name(LogLevel::Warn), "warn");
  EXPECT_STREQ(log_level_name(LogLevel::Debug), "debug");
}
