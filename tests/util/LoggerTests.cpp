// Repository: pixelctl
// Component: Logger Tests
// Purpose: Level routing, the debug gate and quiet mode.
// Copyright (c) 2026 Pixelctl

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "pixelctl/util/Logger.hpp"

namespace pixelctl::util::testing {
namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetCapture([this](LogLevel level, const std::string& line) {
      lines_.emplace_back(level, line);
    });
  }

  void TearDown() override {
    Logger::SetCapture(nullptr);
    Logger::SetQuiet(false);
    ::unsetenv("PIXELCTL_DEBUG");
  }

  std::vector<std::pair<LogLevel, std::string>> lines_;
};

TEST_F(LoggerTest, CaptureSeesEachLevel) {
  Logger::Info("[Test] A");
  Logger::Warn("[Test] B");
  Logger::Error("[Test] C");
  ASSERT_EQ(lines_.size(), 3u);
  EXPECT_EQ(lines_[0], std::make_pair(LogLevel::kInfo, std::string("[Test] A")));
  EXPECT_EQ(lines_[1].first, LogLevel::kWarn);
  EXPECT_EQ(lines_[2].first, LogLevel::kError);
}

TEST_F(LoggerTest, DebugNeedsEnvironmentSwitch) {
  ::unsetenv("PIXELCTL_DEBUG");
  Logger::Debug("[Test] hidden");
  EXPECT_TRUE(lines_.empty());

  ::setenv("PIXELCTL_DEBUG", "1", 1);
  Logger::Debug("[Test] shown");
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0].first, LogLevel::kDebug);
}

TEST_F(LoggerTest, QuietStillCaptures) {
  Logger::SetQuiet(true);
  Logger::Info("[Test] quiet");
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0].second, "[Test] quiet");
}

TEST_F(LoggerTest, DetachedCaptureSeesNothing) {
  Logger::SetCapture(nullptr);
  Logger::Error("[Test] nobody listening");
  EXPECT_TRUE(lines_.empty());
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ(ToString(LogLevel::kDebug), "debug");
  EXPECT_STREQ(ToString(LogLevel::kError), "error");
}

}  // namespace
}  // namespace pixelctl::util::testing
