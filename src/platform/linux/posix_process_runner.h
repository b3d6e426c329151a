// Copyright 2026 The snapbridge Authors
// POSIX bridge launcher: fork/execvp with separate stdout/stderr pipes.

#ifndef SNAPBRIDGE_PLATFORM_LINUX_POSIX_PROCESS_RUNNER_H_
#define SNAPBRIDGE_PLATFORM_LINUX_POSIX_PROCESS_RUNNER_H_

#include "bridge/process_runner.h"

namespace snapbridge {
namespace internal {

class PosixProcessRunner : public ProcessRunner {
 public:
  PosixProcessRunner() = default;
  ~PosixProcessRunner() override = default;

  ProcessOutput Run(const BridgeCommand& command,
                    const RunLimits& limits) override;
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_PLATFORM_LINUX_POSIX_PROCESS_RUNNER_H_
