// tests/unit/basic/test_log.cpp - Level parsing and sink output of the logger
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "crusty/basic/log.hpp"

using namespace crusty::log;

namespace
{

/// Routes the process-wide logger into a string for the duration of a test.
class LogCaptureTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    saved_level_ = Logger::instance().level();
    Logger::instance().set_sink(&out_);
  }

  void TearDown() override
  {
    Logger::instance().set_sink(nullptr);
    Logger::instance().set_level(saved_level_);
  }

  std::ostringstream out_;
  LogLevel saved_level_ = LogLevel::Warn;
};

}  // namespace

TEST(LogLevelParse, AcceptsKnownNamesCaseInsensitively)
{
  EXPECT_EQ(parse_level("trace").value_or(LogLevel::Off), LogLevel::Trace);
  EXPECT_EQ(parse_level("DEBUG").value_or(LogLevel::Off), LogLevel::Debug);
  EXPECT_EQ(parse_level("Info").value_or(LogLevel::Off), LogLevel::Info);
  EXPECT_EQ(parse_level("warning").value_or(LogLevel::Off), LogLevel::Warn);
  EXPECT_EQ(parse_level("error").value_or(LogLevel::Off), LogLevel::Error);
  EXPECT_EQ(parse_level("off").value_or(LogLevel::Trace), LogLevel::Off);
  EXPECT_FALSE(parse_level("verbose").has_value());
  EXPECT_FALSE(parse_level("").has_value());
}

TEST(LogLevelParse, Names)
{
  EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
  EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
}

TEST_F(LogCaptureTest, WritesModuleTaggedLines)
{
  Logger::instance().set_level(LogLevel::Debug);
  CRUSTY_LOG_DEBUG("sema", "registered alias '{}'", "Id");
  CRUSTY_LOG_INFO("driver", "wrote {} files", 2);
  EXPECT_EQ(out_.str(), "[DEBUG sema] registered alias 'Id'\n[INFO driver] wrote 2 files\n");
}

TEST_F(LogCaptureTest, ThresholdFiltersLowerLevels)
{
  Logger::instance().set_level(LogLevel::Warn);
  CRUSTY_LOG_DEBUG("parser", "hidden");
  CRUSTY_LOG_INFO("parser", "hidden");
  CRUSTY_LOG_WARN("parser", "shown");
  EXPECT_EQ(out_.str(), "[WARN parser] shown\n");
}

TEST_F(LogCaptureTest, OffSilencesEverything)
{
  Logger::instance().set_level(LogLevel::Off);
  CRUSTY_LOG_ERROR("driver", "nothing");
  EXPECT_TRUE(out_.str().empty());
  EXPECT_FALSE(Logger::instance().should_log(LogLevel::Error));
}
