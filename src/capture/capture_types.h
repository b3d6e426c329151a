// Copyright 2026 The snapbridge Authors
//
// Request, inventory and result types shared by the capture pipeline.
// Every value lives for one request only.

#ifndef SNAPBRIDGE_CAPTURE_CAPTURE_TYPES_H_
#define SNAPBRIDGE_CAPTURE_CAPTURE_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snapbridge {
namespace internal {

/// Rectangle in virtual-screen physical pixels.
struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool empty() const { return width <= 0 || height <= 0; }
  int right() const { return x + width; }
  int bottom() const { return y + height; }
};

inline bool operator==(const Rect& a, const Rect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width &&
         a.height == b.height;
}

enum class TargetKind {
  kAllMonitors,
  kPrimary,
  kMonitorIndex,
  kWindowByTitle,
  kWindowByProcess,
};

/// What the caller asked to capture.  Exactly one variant is active.
struct TargetSpec {
  TargetKind kind = TargetKind::kAllMonitors;
  int monitor_index = 0;              ///< 1-based, kMonitorIndex only
  std::string query;                  ///< Title or process, window kinds only
  std::optional<int> preferred_index; ///< Absent: not supplied by the caller

  bool is_window_query() const {
    return kind == TargetKind::kWindowByTitle ||
           kind == TargetKind::kWindowByProcess;
  }
};

enum class OutputMode { kDirect, kFile };

struct CaptureRequest {
  TargetSpec target;
  OutputMode output_mode = OutputMode::kDirect;
  int quality = 80;
  std::string filename = "screenshot.png";
  std::string folder;
};

enum class ClipboardFormat { kAuto, kText, kImage };

struct MonitorInfo {
  Rect bounds;
  bool is_primary = false;
  std::string name;
};

/// A visible top-level window with a non-empty title.
struct WindowMatch {
  std::string title;
  std::string process_name;  ///< Executable name, e.g. "chrome.exe"
  uint64_t handle = 0;       ///< Opaque correlation token (HWND value)
  Rect bounds;
};

/// Monitors and windows as reported by one enumeration round-trip.
struct DesktopInventory {
  Rect virtual_screen;
  std::vector<MonitorInfo> monitors;
  std::vector<WindowMatch> windows;
};

enum class QueryKind { kNone, kTitle, kProcess };

/// Resolved capture region.  Immutable once built by TargetResolver.
struct CaptureTarget {
  enum class Kind { kRegion, kWindow };

  Kind kind = Kind::kRegion;
  Rect bounds;
  uint64_t window_handle = 0;
  QueryKind query_kind = QueryKind::kNone;
  std::string search_term;  ///< Reported back if the window disappears
};

/// Several windows matched a query and no valid index was supplied.
struct AmbiguousMatch {
  std::string search_term;
  std::vector<WindowMatch> matches;  ///< Resolver order, never empty
  std::string cancel_line;           ///< Verbatim bridge cancel line, if any
};

/// Typed outcome of one bridge invocation.
struct CaptureResult {
  enum class Kind {
    kImage,
    kText,
    kAmbiguous,
    kWindowNotFound,
    kProcessNotFound,
    kError,
    kEmptyClipboard,
    kNoTextInClipboard,
    kNoImageInClipboard,
    kCompleted,
    kBridgeFailure,
    kParseError,
  };

  Kind kind = Kind::kBridgeFailure;
  std::vector<uint8_t> image_bytes;  ///< Lossless (PNG) bytes, kImage
  std::string text;       ///< Clipboard text, search term, or message
  AmbiguousMatch ambiguous;
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CAPTURE_CAPTURE_TYPES_H_
