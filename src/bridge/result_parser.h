// Copyright 2026 The snapbridge Authors
//
// Interprets bridge output.  The bridge signals outcomes with sentinel
// tokens on either stream, and a failing exit status may still carry a
// meaningful sentinel, so both streams are always inspected.

#ifndef SNAPBRIDGE_BRIDGE_RESULT_PARSER_H_
#define SNAPBRIDGE_BRIDGE_RESULT_PARSER_H_

#include <string>
#include <vector>

#include "bridge/process_runner.h"
#include "capture/capture_types.h"

namespace snapbridge {
namespace internal {

// Sentinel tokens.
constexpr char kMarkerBase64[] = "BASE64:";
constexpr char kMarkerError[] = "ERROR:";
constexpr char kMarkerWindowNotFound[] = "WINDOW_NOT_FOUND:";
constexpr char kMarkerProcessNotFound[] = "PROCESS_NOT_FOUND:";
constexpr char kMarkerMultipleWindows[] = "MULTIPLE_WINDOWS_FOUND:";
constexpr char kMarkerDebug[] = "DEBUG:";
constexpr char kMarkerTextContent[] = "TEXT_CONTENT:";
constexpr char kMarkerEmptyClipboard[] = "EMPTY_CLIPBOARD";
constexpr char kMarkerNoText[] = "NO_TEXT_IN_CLIPBOARD";
constexpr char kMarkerNoImage[] = "NO_IMAGE_IN_CLIPBOARD";
constexpr char kMarkerVirtualScreen[] = "VIRTUAL_SCREEN:";
constexpr char kMarkerMonitor[] = "MONITOR:";
constexpr char kMarkerWindow[] = "WINDOW:";

/// Classify the output of a capture command.
///
/// Precedence: MULTIPLE_WINDOWS_FOUND, WINDOW_NOT_FOUND, PROCESS_NOT_FOUND,
/// BASE64 (stdout), ERROR, then exit status.  With no sentinel a clean exit
/// is kCompleted in File mode and kParseError in Direct mode.
CaptureResult ParseCaptureOutput(const ProcessOutput& output, OutputMode mode);

/// Classify the output of a clipboard command.
CaptureResult ParseClipboardOutput(const ProcessOutput& output);

/// Parse VIRTUAL_SCREEN / MONITOR / WINDOW lines.  Malformed lines are
/// skipped.  Throws BridgeError when the output has no inventory at all.
DesktopInventory ParseInventory(const ProcessOutput& output);

/// Parse the "{i}. {title} ({process})" list that follows
/// MULTIPLE_WINDOWS_FOUND.  CLIXML framing and blank lines are dropped; a
/// trailing "Cancel capture" line is stored verbatim in `cancel_line`.
std::vector<WindowMatch> ParseWindowList(const std::string& raw,
                                         std::string* cancel_line);

/// Trim ASCII whitespace (including CR) from both ends.
std::string TrimWhitespace(const std::string& s);

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_BRIDGE_RESULT_PARSER_H_
