// Copyright 2026 The snapbridge Authors

#include "capture/target_resolver.h"

#include <algorithm>
#include <string>

#include "capture/disambiguation_formatter.h"
#include "core/bridge_error.h"
#include "core/logger.h"

namespace snapbridge {
namespace internal {

std::string AsciiLower(const std::string& s) {
  std::string out(s);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

std::string StripExeSuffix(const std::string& name) {
  static const std::string kSuffix = ".exe";
  if (name.size() >= kSuffix.size() &&
      AsciiLower(name.substr(name.size() - kSuffix.size())) == kSuffix) {
    return name.substr(0, name.size() - kSuffix.size());
  }
  return name;
}

namespace {

bool ContainsIgnoreCase(const std::string& haystack,
                        const std::string& needle) {
  return AsciiLower(haystack).find(AsciiLower(needle)) != std::string::npos;
}

CaptureTarget MakeRegionTarget(const Rect& bounds) {
  if (bounds.empty()) {
    throw BridgeError(kSnapBridgeErrorInvalidRegion,
                      "Capture region has no visible area (" +
                          std::to_string(bounds.width) + "x" +
                          std::to_string(bounds.height) + ")");
  }
  CaptureTarget target;
  target.kind = CaptureTarget::Kind::kRegion;
  target.bounds = bounds;
  return target;
}

CaptureTarget MakeWindowTarget(const WindowMatch& match,
                               const TargetSpec& spec) {
  if (match.bounds.empty()) {
    throw BridgeError(kSnapBridgeErrorInvalidRegion,
                      "Window \"" + match.title +
                          "\" has no visible area (is it minimized?)");
  }
  CaptureTarget target;
  target.kind = CaptureTarget::Kind::kWindow;
  target.bounds = match.bounds;
  target.window_handle = match.handle;
  target.query_kind = spec.kind == TargetKind::kWindowByProcess
                          ? QueryKind::kProcess
                          : QueryKind::kTitle;
  target.search_term = spec.query;
  return target;
}

}  // namespace

TargetResolver::TargetResolver(const DesktopInventory& inventory)
    : inventory_(inventory) {}

Resolution TargetResolver::Resolve(const TargetSpec& spec) const {
  if (spec.is_window_query()) return ResolveWindow(spec);
  Resolution resolution;
  resolution.target = ResolveMonitor(spec);
  return resolution;
}

Rect TargetResolver::VirtualDesktopBounds() const {
  if (inventory_.monitors.empty()) return inventory_.virtual_screen;

  const Rect& first = inventory_.monitors.front().bounds;
  int left = first.x;
  int top = first.y;
  int right = first.right();
  int bottom = first.bottom();
  for (const auto& m : inventory_.monitors) {
    left = std::min(left, m.bounds.x);
    top = std::min(top, m.bounds.y);
    right = std::max(right, m.bounds.right());
    bottom = std::max(bottom, m.bounds.bottom());
  }
  return Rect{left, top, right - left, bottom - top};
}

std::vector<MonitorInfo> TargetResolver::SortedMonitors() const {
  std::vector<MonitorInfo> sorted(inventory_.monitors);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const MonitorInfo& a, const MonitorInfo& b) {
                     return a.bounds.x < b.bounds.x;
                   });
  return sorted;
}

CaptureTarget TargetResolver::ResolveMonitor(const TargetSpec& spec) const {
  switch (spec.kind) {
    case TargetKind::kAllMonitors:
      return MakeRegionTarget(VirtualDesktopBounds());

    case TargetKind::kPrimary: {
      for (const auto& m : inventory_.monitors) {
        if (m.is_primary) return MakeRegionTarget(m.bounds);
      }
      throw BridgeError(kSnapBridgeErrorMonitorNotFound,
                        "No primary monitor reported by the bridge");
    }

    case TargetKind::kMonitorIndex: {
      auto sorted = SortedMonitors();
      int count = static_cast<int>(sorted.size());
      if (spec.monitor_index < 1 || spec.monitor_index > count) {
        throw BridgeError(
            kSnapBridgeErrorInvalidMonitorIndex,
            "Monitor " + std::to_string(spec.monitor_index) +
                " not found. Available monitors: 1 to " +
                std::to_string(count));
      }
      const auto& chosen = sorted[spec.monitor_index - 1];
      SNAPBRIDGE_LOG_DEBUG("Monitor {} -> {} at ({},{}) {}x{}",
                           spec.monitor_index, chosen.name, chosen.bounds.x,
                           chosen.bounds.y, chosen.bounds.width,
                           chosen.bounds.height);
      return MakeRegionTarget(chosen.bounds);
    }

    default:
      break;
  }
  throw BridgeError(kSnapBridgeErrorInvalidParam, "Not a monitor target");
}

std::vector<WindowMatch> TargetResolver::FindWindows(
    const TargetSpec& spec) const {
  std::vector<WindowMatch> found;
  const bool by_process = spec.kind == TargetKind::kWindowByProcess;
  const std::string needle =
      by_process ? StripExeSuffix(spec.query) : spec.query;

  for (const auto& w : inventory_.windows) {
    if (w.title.empty()) continue;
    const std::string hay =
        by_process ? StripExeSuffix(w.process_name) : w.title;
    if (ContainsIgnoreCase(hay, needle)) {
      found.push_back(w);
    }
  }
  return found;
}

Resolution TargetResolver::ResolveWindow(const TargetSpec& spec) const {
  const bool by_process = spec.kind == TargetKind::kWindowByProcess;
  if (spec.query.empty()) {
    throw BridgeError(kSnapBridgeErrorInvalidParam,
                      by_process ? "processName must not be empty"
                                 : "windowTitle must not be empty");
  }

  auto matches = FindWindows(spec);
  SNAPBRIDGE_LOG_DEBUG("'{}' matched {} of {} windows", spec.query,
                       matches.size(), inventory_.windows.size());

  if (matches.empty()) {
    if (by_process) {
      throw BridgeError(kSnapBridgeErrorProcessNotFound,
                        FormatProcessNotFound(spec.query));
    }
    throw BridgeError(kSnapBridgeErrorWindowNotFound,
                      FormatWindowNotFound(spec.query));
  }

  Resolution resolution;
  if (matches.size() == 1) {
    resolution.target = MakeWindowTarget(matches.front(), spec);
    return resolution;
  }

  const int count = static_cast<int>(matches.size());
  if (spec.preferred_index && *spec.preferred_index >= 1 &&
      *spec.preferred_index <= count) {
    resolution.target =
        MakeWindowTarget(matches[*spec.preferred_index - 1], spec);
    return resolution;
  }

  resolution.ambiguity.search_term = spec.query;
  resolution.ambiguity.matches = std::move(matches);
  return resolution;
}

}  // namespace internal
}  // namespace snapbridge
