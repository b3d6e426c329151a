// Copyright 2026 The snapbridge Authors

#ifndef SNAPBRIDGE_CAPTURE_TARGET_RESOLVER_H_
#define SNAPBRIDGE_CAPTURE_TARGET_RESOLVER_H_

#include <string>
#include <vector>

#include "capture/capture_types.h"

namespace snapbridge {
namespace internal {

/// Outcome of resolving a TargetSpec: either a target or an ambiguity.
struct Resolution {
  bool is_ambiguous() const { return !ambiguity.matches.empty(); }

  CaptureTarget target;
  AmbiguousMatch ambiguity;
};

/// Resolves a TargetSpec against one DesktopInventory snapshot.
///
/// Throws BridgeError for kSnapBridgeErrorInvalidMonitorIndex,
/// kSnapBridgeErrorMonitorNotFound, kSnapBridgeErrorWindowNotFound,
/// kSnapBridgeErrorProcessNotFound and kSnapBridgeErrorInvalidRegion.
class TargetResolver {
 public:
  explicit TargetResolver(const DesktopInventory& inventory);

  Resolution Resolve(const TargetSpec& spec) const;

  /// Union of all monitor rectangles (virtual screen when none reported).
  Rect VirtualDesktopBounds() const;

  /// Monitors in left-to-right visual order (stable for equal origins).
  std::vector<MonitorInfo> SortedMonitors() const;

  /// Windows matching a title or process query, in enumeration order.
  std::vector<WindowMatch> FindWindows(const TargetSpec& spec) const;

 private:
  CaptureTarget ResolveMonitor(const TargetSpec& spec) const;
  Resolution ResolveWindow(const TargetSpec& spec) const;

  const DesktopInventory& inventory_;
};

/// Lower-cased copy (ASCII only; other bytes pass through).
std::string AsciiLower(const std::string& s);

/// Strip a trailing ".exe" (any case).
std::string StripExeSuffix(const std::string& name);

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CAPTURE_TARGET_RESOLVER_H_
