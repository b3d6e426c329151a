// Copyright 2026 The snapbridge Authors

#ifndef SNAPBRIDGE_CORE_BRIDGE_ERROR_H_
#define SNAPBRIDGE_CORE_BRIDGE_ERROR_H_

#include <stdexcept>
#include <string>

#include "snapbridge/snapbridge.h"

namespace snapbridge {
namespace internal {

/// Error raised by the internal pipeline.  Caught once at the context
/// boundary and stored as the context's last error.
class BridgeError : public std::runtime_error {
 public:
  BridgeError(SnapBridgeError code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  SnapBridgeError code() const noexcept { return code_; }

 private:
  SnapBridgeError code_;
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CORE_BRIDGE_ERROR_H_
