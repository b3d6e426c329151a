// Copyright 2026 The snapbridge Authors
// Tests for: snapbridge_set_log_level, snapbridge_set_log_callback,
//            snapbridge_log, internal::ParseLogLevel

#include <cstdlib>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "snapbridge/snapbridge.h"

#include "core/logger.h"

// ---------------------------------------------------------------------------
// Helper: capture log messages via callback
// ---------------------------------------------------------------------------

struct LogEntry {
  SnapBridgeLogLevel level;
  std::string message;
};

static void TestLogCallback(SnapBridgeLogLevel level, const char* message,
                            void* userdata) {
  auto* entries = static_cast<std::vector<LogEntry>*>(userdata);
  entries->push_back({level, message ? message : ""});
}

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    entries_.clear();
    snapbridge_set_log_level(kSnapBridgeLogTrace);
    snapbridge_set_log_callback(TestLogCallback, &entries_);
  }

  void TearDown() override {
    snapbridge_set_log_callback(nullptr, nullptr);
    snapbridge_set_log_level(kSnapBridgeLogInfo);
  }

  bool Contains(const std::string& text) const {
    for (const auto& e : entries_) {
      if (e.message.find(text) != std::string::npos) return true;
    }
    return false;
  }

  std::vector<LogEntry> entries_;
};

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, LogCallbackReceivesMessage) {
  snapbridge_log(kSnapBridgeLogInfo, "test message");
  ASSERT_GE(entries_.size(), 1u);
  EXPECT_TRUE(Contains("test message"));
}

TEST_F(LoggingTest, MessagesCarryLoggerPrefix) {
  snapbridge_log(kSnapBridgeLogInfo, "prefixed");
  ASSERT_FALSE(entries_.empty());
  EXPECT_NE(entries_.back().message.find("[snapbridge]"), std::string::npos);
}

TEST_F(LoggingTest, CallbackLinesHaveNoTrailingNewline) {
  snapbridge_log(kSnapBridgeLogInfo, "one line");
  ASSERT_FALSE(entries_.empty());
  const std::string& msg = entries_.back().message;
  ASSERT_FALSE(msg.empty());
  EXPECT_NE(msg.back(), '\n');
  EXPECT_NE(msg.back(), '\r');
}

TEST_F(LoggingTest, LogCallbackReceivesCorrectLevel) {
  snapbridge_log(kSnapBridgeLogWarn, "warn msg");
  bool found = false;
  for (const auto& e : entries_) {
    if (e.level == kSnapBridgeLogWarn &&
        e.message.find("warn msg") != std::string::npos) {
      found = true;
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(LoggingTest, LogLevelFiltering) {
  snapbridge_set_log_level(kSnapBridgeLogWarn);
  entries_.clear();

  snapbridge_log(kSnapBridgeLogInfo, "should be filtered");
  snapbridge_log(kSnapBridgeLogError, "should appear");

  EXPECT_FALSE(Contains("should be filtered"));
  EXPECT_TRUE(Contains("should appear"));
}

TEST_F(LoggingTest, InternalMacrosReachCallback) {
  SNAPBRIDGE_LOG_DEBUG("internal {} {}", "debug", 42);
  EXPECT_TRUE(Contains("internal debug 42"));
}

TEST_F(LoggingTest, UnregisterCallback) {
  snapbridge_set_log_callback(nullptr, nullptr);
  entries_.clear();
  snapbridge_log(kSnapBridgeLogInfo, "after unregister");
  EXPECT_FALSE(Contains("after unregister"));
}

TEST_F(LoggingTest, LogNullMessage) {
  snapbridge_log(kSnapBridgeLogInfo, nullptr);
  EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, ContextCreationKeepsCallerLevel) {
  // No settings file, so nothing names a log_level.
  std::string config_home = ::testing::TempDir() + "snapbridge_no_config";
  setenv("XDG_CONFIG_HOME", config_home.c_str(), 1);

  snapbridge_set_log_level(kSnapBridgeLogDebug);
  SnapBridgeContext* ctx = snapbridge_context_create();
  ASSERT_NE(ctx, nullptr);
  EXPECT_EQ(snapbridge::internal::GetLogger()->level(), spdlog::level::debug);

  entries_.clear();
  snapbridge_log(kSnapBridgeLogDebug, "still at debug");
  EXPECT_TRUE(Contains("still at debug"));

  snapbridge_context_destroy(ctx);
  unsetenv("XDG_CONFIG_HOME");
}

TEST(LogLevelNameTest, ParsesSettingsNames) {
  using snapbridge::internal::ParseLogLevel;
  EXPECT_EQ(ParseLogLevel("trace"), kSnapBridgeLogTrace);
  EXPECT_EQ(ParseLogLevel("debug"), kSnapBridgeLogDebug);
  EXPECT_EQ(ParseLogLevel("info"), kSnapBridgeLogInfo);
  EXPECT_EQ(ParseLogLevel("warn"), kSnapBridgeLogWarn);
  EXPECT_EQ(ParseLogLevel("warning"), kSnapBridgeLogWarn);
  EXPECT_EQ(ParseLogLevel("error"), kSnapBridgeLogError);
  EXPECT_EQ(ParseLogLevel("fatal"), kSnapBridgeLogFatal);
  EXPECT_EQ(ParseLogLevel("DEBUG"), kSnapBridgeLogDebug);
  EXPECT_EQ(ParseLogLevel("bogus"), kSnapBridgeLogInfo);
}

TEST(LogLevelNameTest, SpdlogMappingRoundTrips) {
  using snapbridge::internal::FromSpdlogLevel;
  using snapbridge::internal::ToSpdlogLevel;
  for (SnapBridgeLogLevel level :
       {kSnapBridgeLogTrace, kSnapBridgeLogDebug, kSnapBridgeLogInfo,
        kSnapBridgeLogWarn, kSnapBridgeLogError, kSnapBridgeLogFatal}) {
    EXPECT_EQ(FromSpdlogLevel(ToSpdlogLevel(level)), level);
  }
}
