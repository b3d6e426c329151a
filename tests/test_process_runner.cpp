// Copyright 2026 The snapbridge Authors
// Tests for: PosixProcessRunner (stream capture, exit status, timeout,
//            output limit, exec failure)

#include <chrono>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "bridge/bridge_command.h"
#include "platform/linux/posix_process_runner.h"

using snapbridge::internal::BridgeCommand;
using snapbridge::internal::PosixProcessRunner;
using snapbridge::internal::ProcessOutput;
using snapbridge::internal::RunLimits;

namespace {

BridgeCommand Shell(const std::string& script) {
  return BridgeCommand("/bin/sh", {"-c", script}, script);
}

}  // namespace

class ProcessRunnerTest : public ::testing::Test {
 protected:
  PosixProcessRunner runner_;
  RunLimits limits_;
};

TEST_F(ProcessRunnerTest, CapturesBothStreamsSeparately) {
  ProcessOutput out =
      runner_.Run(Shell("printf 'BASE64:AAEC'; printf 'oops' >&2"), limits_);
  EXPECT_EQ(out.stdout_data, "BASE64:AAEC");
  EXPECT_EQ(out.stderr_data, "oops");
  EXPECT_EQ(out.exit_code, 0);
  EXPECT_TRUE(out.succeeded());
}

TEST_F(ProcessRunnerTest, NonZeroExitIsData) {
  ProcessOutput out =
      runner_.Run(Shell("echo 'WINDOW_NOT_FOUND:x' >&2; exit 3"), limits_);
  EXPECT_EQ(out.exit_code, 3);
  EXPECT_FALSE(out.timed_out);
  EXPECT_FALSE(out.succeeded());
  EXPECT_EQ(out.stderr_data, "WINDOW_NOT_FOUND:x\n");
}

TEST_F(ProcessRunnerTest, LargeOutputOnBothStreamsDoesNotDeadlock) {
  ProcessOutput out = runner_.Run(
      Shell("head -c 300000 /dev/zero; head -c 200000 /dev/zero >&2"),
      limits_);
  EXPECT_EQ(out.exit_code, 0);
  EXPECT_EQ(out.stdout_data.size(), 300000u);
  EXPECT_EQ(out.stderr_data.size(), 200000u);
}

TEST_F(ProcessRunnerTest, StdinIsClosed) {
  ProcessOutput out = runner_.Run(Shell("cat; echo done"), limits_);
  EXPECT_EQ(out.stdout_data, "done\n");
}

TEST_F(ProcessRunnerTest, TimeoutKillsChild) {
  limits_.timeout_ms = 200;
  auto start = std::chrono::steady_clock::now();
  ProcessOutput out = runner_.Run(Shell("echo started; exec sleep 30"),
                                  limits_);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(out.timed_out);
  EXPECT_FALSE(out.succeeded());
  EXPECT_EQ(out.stdout_data, "started\n");
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(ProcessRunnerTest, ZeroTimeoutWaits) {
  limits_.timeout_ms = 0;
  ProcessOutput out = runner_.Run(Shell("sleep 0.3; echo late"), limits_);
  EXPECT_FALSE(out.timed_out);
  EXPECT_EQ(out.stdout_data, "late\n");
}

TEST_F(ProcessRunnerTest, OutputLimitStopsChild) {
  limits_.max_output_bytes = 1000;
  ProcessOutput out =
      runner_.Run(Shell("exec head -c 10000000 /dev/zero"), limits_);
  EXPECT_TRUE(out.output_truncated);
  EXPECT_FALSE(out.succeeded());
  EXPECT_GT(out.stdout_data.size(), 1000u);
  EXPECT_LT(out.stdout_data.size(), 10000000u);
}

TEST_F(ProcessRunnerTest, MissingProgramExits127) {
  BridgeCommand missing("snapbridge-no-such-program", {"-NoProfile"}, "");
  ProcessOutput out = runner_.Run(missing, limits_);
  EXPECT_EQ(out.exit_code, 127);
  EXPECT_NE(out.stderr_data.find("cannot execute snapbridge-no-such-program"),
            std::string::npos);
}

TEST_F(ProcessRunnerTest, ArgumentsArePassedVerbatim) {
  BridgeCommand cmd("/bin/sh",
                    {"-c", "printf '%s|' \"$@\"", "sh", "a b", "$(x)", "'q'"},
                    "");
  ProcessOutput out = runner_.Run(cmd, limits_);
  EXPECT_EQ(out.stdout_data, "a b|$(x)|'q'|");
}
