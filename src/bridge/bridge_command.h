// Copyright 2026 The snapbridge Authors

#ifndef SNAPBRIDGE_BRIDGE_BRIDGE_COMMAND_H_
#define SNAPBRIDGE_BRIDGE_BRIDGE_COMMAND_H_

#include <string>
#include <utility>
#include <vector>

namespace snapbridge {
namespace internal {

/// Immutable description of one bridge invocation.  Built only by
/// CommandFormatter, which owns all quoting and encoding.
class BridgeCommand {
 public:
  BridgeCommand(std::string program, std::vector<std::string> arguments,
                std::string script)
      : program_(std::move(program)),
        arguments_(std::move(arguments)),
        script_(std::move(script)) {}

  const std::string& program() const { return program_; }
  const std::vector<std::string>& arguments() const { return arguments_; }

  /// Plain-text script carried (encoded) in the arguments.  For logging and
  /// tests; the bridge only ever sees the encoded form.
  const std::string& script() const { return script_; }

 private:
  std::string program_;
  std::vector<std::string> arguments_;
  std::string script_;
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_BRIDGE_BRIDGE_COMMAND_H_
