// Copyright 2026 The snapbridge Authors

#ifndef SNAPBRIDGE_BRIDGE_PROCESS_RUNNER_H_
#define SNAPBRIDGE_BRIDGE_PROCESS_RUNNER_H_

#include <cstddef>
#include <memory>
#include <string>

#include "bridge/bridge_command.h"

namespace snapbridge {
namespace internal {

struct RunLimits {
  size_t max_output_bytes = 50 * 1024 * 1024;  ///< stdout + stderr combined
  int timeout_ms = 60000;                      ///< 0 = wait forever
};

/// Everything the bridge produced.  A failing exit status is data, not an
/// error: the bridge reports domain errors on its output streams.
struct ProcessOutput {
  std::string stdout_data;
  std::string stderr_data;
  int exit_code = 0;
  bool timed_out = false;
  bool output_truncated = false;

  bool succeeded() const {
    return exit_code == 0 && !timed_out && !output_truncated;
  }
};

/// Abstract interface for launching the bridge process.
///
/// Implementations block until the child exits, the output limit trips, or
/// the timeout expires.  They throw BridgeError only when the process cannot
/// be set up at all (pipe/fork failure).
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  // Non-copyable.
  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;

  virtual ProcessOutput Run(const BridgeCommand& command,
                            const RunLimits& limits) = 0;

 protected:
  ProcessRunner() = default;
};

/// Factory function implemented per-platform.
/// Defined in platform/<os>/xxx_process_runner.cpp.
std::unique_ptr<ProcessRunner> CreatePlatformProcessRunner();

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_BRIDGE_PROCESS_RUNNER_H_
