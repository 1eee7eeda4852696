#include "ebml/core/error.hpp"
#include "ebml/core/log.hpp"

#include "test_main.hpp"

#include <string_view>

namespace {

using ebml::core::errc;
using ebml::core::LogLevel;
using ebml::core::log_level;
using ebml::core::log_level_name;
using ebml::core::parse_log_level;
using ebml::core::set_log_level;

void test_log_level_roundtrip() {
  for (auto level : {LogLevel::trace, LogLevel::debug, LogLevel::info, LogLevel::warn,
                     LogLevel::error, LogLevel::critical, LogLevel::off}) {
    set_log_level(level);
    TEST_EXPECT_EQ(log_level(), level);
  }
}

void test_level_names() {
  TEST_EXPECT_EQ(log_level_name(LogLevel::trace), std::string_view("trace"));
  TEST_EXPECT_EQ(log_level_name(LogLevel::warn), std::string_view("warning"));
  TEST_EXPECT_EQ(log_level_name(LogLevel::error), std::string_view("error"));
  TEST_EXPECT_EQ(log_level_name(LogLevel::off), std::string_view("off"));

  // 名字可以原样解析回同一级别。
  for (auto level : {LogLevel::trace, LogLevel::debug, LogLevel::info, LogLevel::warn,
                     LogLevel::error, LogLevel::critical, LogLevel::off}) {
    LogLevel parsed = LogLevel::trace;
    TEST_EXPECT_OK(parse_log_level(log_level_name(level), parsed));
    TEST_EXPECT_EQ(parsed, level);
  }
}

void test_parse_log_level() {
  LogLevel level = LogLevel::off;
  TEST_EXPECT_OK(parse_log_level("debug", level));
  TEST_EXPECT_EQ(level, LogLevel::debug);

  TEST_EXPECT_OK(parse_log_level("TRACE", level));
  TEST_EXPECT_EQ(level, LogLevel::trace);

  TEST_EXPECT_OK(parse_log_level("Warning", level));
  TEST_EXPECT_EQ(level, LogLevel::warn);

  TEST_EXPECT_OK(parse_log_level("warn", level));
  TEST_EXPECT_EQ(level, LogLevel::warn);

  TEST_EXPECT_OK(parse_log_level("OFF", level));
  TEST_EXPECT_EQ(level, LogLevel::off);

  TEST_EXPECT_OK(parse_log_level("err", level));
  TEST_EXPECT_EQ(level, LogLevel::error);

  // 失败时 out 保持不变。
  TEST_EXPECT_ERR(parse_log_level("verbose", level), errc::invalid_argument);
  TEST_EXPECT_EQ(level, LogLevel::error);
  TEST_EXPECT_ERR(parse_log_level("", level), errc::invalid_argument);
  TEST_EXPECT_ERR(parse_log_level("criticality", level), errc::invalid_argument);
  TEST_EXPECT_EQ(level, LogLevel::error);
}

}  // namespace

int main() {
  test_log_level_roundtrip();
  test_level_names();
  test_parse_log_level();
  set_log_level(LogLevel::off);
  return ::ebml::tests::run_and_report();
}
