// Copyright 2026 The snapbridge Authors
// POSIX bridge launcher: fork/execvp, poll-driven pipe draining, timeout.

#include "platform/linux/posix_process_runner.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <vector>

#include "core/bridge_error.h"
#include "core/logger.h"

namespace snapbridge {
namespace internal {

namespace {

constexpr int kExecFailedStatus = 127;

struct FdGuard {
  int fd = -1;

  FdGuard() = default;
  ~FdGuard() { Close(); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  void Close() {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
};

void MakePipe(FdGuard* read_end, FdGuard* write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw BridgeError(kSnapBridgeErrorBridgeFailure,
                      std::string("pipe() failed: ") + std::strerror(errno));
  }
  read_end->fd = fds[0];
  write_end->fd = fds[1];
}

// Runs in the child after fork(): only async-signal-safe calls.
[[noreturn]] void ExecChild(int out_fd, int err_fd, char* const argv[]) {
  if (::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(err_fd, STDERR_FILENO) < 0) {
    ::_exit(kExecFailedStatus);
  }
  int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }
  ::execvp(argv[0], argv);

  const char* reason = std::strerror(errno);
  const char prefix[] = "snapbridge: cannot execute ";
  ssize_t ignored = ::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
  ignored = ::write(STDERR_FILENO, argv[0], std::strlen(argv[0]));
  ignored = ::write(STDERR_FILENO, ": ", 2);
  ignored = ::write(STDERR_FILENO, reason, std::strlen(reason));
  ignored = ::write(STDERR_FILENO, "\n", 1);
  (void)ignored;
  ::_exit(kExecFailedStatus);
}

int WaitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      SNAPBRIDGE_LOG_ERROR("waitpid failed: {}", std::strerror(errno));
      return -1;
    }
  }
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

}  // namespace

ProcessOutput PosixProcessRunner::Run(const BridgeCommand& command,
                                      const RunLimits& limits) {
  // argv is assembled before fork(): the child must not allocate.
  std::vector<std::string> args;
  args.reserve(command.arguments().size() + 1);
  args.push_back(command.program());
  for (const auto& a : command.arguments()) args.push_back(a);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& a : args) argv.push_back(&a[0]);
  argv.push_back(nullptr);

  FdGuard out_read, out_write, err_read, err_write;
  MakePipe(&out_read, &out_write);
  MakePipe(&err_read, &err_write);

  SNAPBRIDGE_LOG_DEBUG("Launching bridge: {} ({} args)", command.program(),
                       command.arguments().size());

  pid_t pid = ::fork();
  if (pid < 0) {
    throw BridgeError(kSnapBridgeErrorBridgeFailure,
                      std::string("fork() failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    ExecChild(out_write.fd, err_write.fd, argv.data());
  }

  out_write.Close();
  err_write.Close();

  ProcessOutput output;
  const auto start = std::chrono::steady_clock::now();
  const bool has_deadline = limits.timeout_ms > 0;
  const auto deadline = start + std::chrono::milliseconds(limits.timeout_ms);
  bool killed = false;

  FdGuard* streams[2] = {&out_read, &err_read};
  std::string* sinks[2] = {&output.stdout_data, &output.stderr_data};
  char buffer[65536];

  while (out_read.fd >= 0 || err_read.fd >= 0) {
    int wait_ms = -1;
    if (has_deadline) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        output.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(remaining.count());
    }

    struct pollfd fds[2];
    nfds_t count = 0;
    int index_of[2] = {-1, -1};
    for (int i = 0; i < 2; ++i) {
      if (streams[i]->fd < 0) continue;
      fds[count].fd = streams[i]->fd;
      fds[count].events = POLLIN;
      fds[count].revents = 0;
      index_of[count] = i;
      ++count;
    }

    int ready = ::poll(fds, count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      SNAPBRIDGE_LOG_ERROR("poll failed: {}", std::strerror(errno));
      killed = true;
      break;
    }
    if (ready == 0) continue;  // Deadline re-checked at loop top.

    for (nfds_t k = 0; k < count; ++k) {
      if (fds[k].revents == 0) continue;
      int i = index_of[k];
      ssize_t n = ::read(streams[i]->fd, buffer, sizeof(buffer));
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) {
        streams[i]->Close();
        continue;
      }
      sinks[i]->append(buffer, static_cast<size_t>(n));
    }

    if (output.stdout_data.size() + output.stderr_data.size() >
        limits.max_output_bytes) {
      output.output_truncated = true;
      break;
    }
  }

  if (output.timed_out || output.output_truncated || killed) {
    ::kill(pid, SIGKILL);
  }
  out_read.Close();
  err_read.Close();
  output.exit_code = WaitForChild(pid);

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  if (output.timed_out) {
    SNAPBRIDGE_LOG_WARN("Bridge timed out after {} ms; killed", limits.timeout_ms);
  } else if (output.output_truncated) {
    SNAPBRIDGE_LOG_WARN("Bridge output exceeded {} bytes; killed",
                        limits.max_output_bytes);
  } else {
    SNAPBRIDGE_LOG_DEBUG("Bridge exited with {} in {} ms ({} + {} bytes)",
                         output.exit_code, elapsed.count(),
                         output.stdout_data.size(), output.stderr_data.size());
  }
  return output;
}

std::unique_ptr<ProcessRunner> CreatePlatformProcessRunner() {
  return std::make_unique<PosixProcessRunner>();
}

}  // namespace internal
}  // namespace snapbridge
