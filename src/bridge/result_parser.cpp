// Copyright 2026 The snapbridge Authors

#include "bridge/result_parser.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include "core/base64.h"
#include "core/bridge_error.h"
#include "core/logger.h"

namespace snapbridge {
namespace internal {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
         c == '\v';
}

bool Contains(const std::string& hay, const char* needle) {
  return hay.find(needle) != std::string::npos;
}

/// Text after `marker` up to the end of its line, trimmed.
std::string RestOfLine(const std::string& text, size_t marker_pos,
                       size_t marker_len) {
  size_t start = marker_pos + marker_len;
  size_t end = text.find('\n', start);
  if (end == std::string::npos) end = text.size();
  return TrimWhitespace(text.substr(start, end - start));
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

/// Split `line` into at most `max_fields` fields on ':'.  The last field
/// keeps any remaining colons.
std::vector<std::string> SplitFields(const std::string& line,
                                     size_t max_fields) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (fields.size() + 1 < max_fields) {
    size_t colon = line.find(':', start);
    if (colon == std::string::npos) break;
    fields.push_back(line.substr(start, colon - start));
    start = colon + 1;
  }
  fields.push_back(line.substr(start));
  return fields;
}

bool ParseInt64(const std::string& text, int64_t* out) {
  std::string s = TrimWhitespace(text);
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0') return false;
  *out = static_cast<int64_t>(value);
  return true;
}

bool ParseInt(const std::string& text, int* out) {
  int64_t value = 0;
  if (!ParseInt64(text, &value)) return false;
  if (value < INT32_MIN || value > INT32_MAX) return false;
  *out = static_cast<int>(value);
  return true;
}

bool ParseRect(const std::vector<std::string>& fields, size_t first,
               Rect* rect) {
  return fields.size() >= first + 4 && ParseInt(fields[first], &rect->x) &&
         ParseInt(fields[first + 1], &rect->y) &&
         ParseInt(fields[first + 2], &rect->width) &&
         ParseInt(fields[first + 3], &rect->height);
}

/// Decode the payload following a BASE64: marker in `stdout_data`.
/// Returns false when the payload is empty or not valid base64.
bool ExtractBase64Payload(const std::string& stdout_data, size_t marker_pos,
                          std::vector<uint8_t>* out) {
  std::string data = stdout_data.substr(marker_pos + strlen(kMarkerBase64));
  size_t error_pos = data.find(kMarkerError);
  if (error_pos != std::string::npos) data.resize(error_pos);
  data = TrimWhitespace(data);

  // The payload ends at the first character that is neither base64 nor
  // whitespace (trailing bridge chatter).
  size_t end = 0;
  while (end < data.size() && (IsBase64Char(data[end]) || IsSpace(data[end]))) {
    ++end;
  }
  data = TrimWhitespace(data.substr(0, end));
  if (data.empty()) return false;
  return Base64Decode(data, out) && !out->empty();
}

CaptureResult MakeResult(CaptureResult::Kind kind, std::string text = {}) {
  CaptureResult result;
  result.kind = kind;
  result.text = std::move(text);
  return result;
}

/// Message for a failed run that produced no recognized sentinel.
std::string FailureMessage(const ProcessOutput& output) {
  std::string err = TrimWhitespace(output.stderr_data);
  if (!err.empty()) return err;
  return "Bridge exited with status " + std::to_string(output.exit_code) +
         " and produced no diagnostic output";
}

/// Shared tail of the precedence chain: BASE64, ERROR, exit status.
/// Returns true when `result` was filled.
bool ParsePayloadOrError(const ProcessOutput& output,
                         const std::string& combined, CaptureResult* result) {
  size_t b64 = output.stdout_data.find(kMarkerBase64);
  if (b64 != std::string::npos) {
    std::vector<uint8_t> bytes;
    if (!ExtractBase64Payload(output.stdout_data, b64, &bytes)) {
      *result = MakeResult(CaptureResult::Kind::kParseError,
                           "Invalid base64 image data from bridge");
      return true;
    }
    *result = MakeResult(CaptureResult::Kind::kImage);
    result->image_bytes = std::move(bytes);
    return true;
  }

  size_t err = combined.find(kMarkerError);
  if (err != std::string::npos) {
    std::string message = RestOfLine(combined, err, strlen(kMarkerError));
    if (message.empty()) message = "Unknown bridge error";
    *result = MakeResult(CaptureResult::Kind::kError, std::move(message));
    return true;
  }

  if (output.exit_code != 0) {
    *result = MakeResult(CaptureResult::Kind::kBridgeFailure,
                         FailureMessage(output));
    return true;
  }
  return false;
}

/// Parse "3. Title text (proc.exe)" into a WindowMatch.
bool ParseOptionLine(const std::string& line, WindowMatch* match) {
  size_t pos = 0;
  while (pos < line.size() && line[pos] >= '0' && line[pos] <= '9') ++pos;
  if (pos == 0 || pos + 1 >= line.size() || line[pos] != '.') return false;
  std::string rest = TrimWhitespace(line.substr(pos + 1));
  if (rest.empty()) return false;

  match->title = rest;
  match->process_name.clear();
  if (rest.back() == ')') {
    size_t open = rest.rfind(" (");
    if (open != std::string::npos) {
      match->title = TrimWhitespace(rest.substr(0, open));
      match->process_name = rest.substr(open + 2, rest.size() - open - 3);
    }
  }
  return !match->title.empty();
}

}  // namespace

std::string TrimWhitespace(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && IsSpace(s[begin])) ++begin;
  while (end > begin && IsSpace(s[end - 1])) --end;
  return s.substr(begin, end - begin);
}

std::vector<WindowMatch> ParseWindowList(const std::string& raw,
                                         std::string* cancel_line) {
  std::vector<std::string> lines;
  for (const auto& line : SplitLines(raw)) {
    std::string trimmed = TrimWhitespace(line);
    if (trimmed.empty()) continue;
    if (Contains(trimmed, "<Objs") || Contains(trimmed, "</Objs>") ||
        Contains(trimmed, "<Obj") || Contains(trimmed, "</Obj>")) {
      continue;
    }
    lines.push_back(trimmed);
  }

  if (cancel_line) cancel_line->clear();
  if (!lines.empty() && Contains(lines.back(), "Cancel capture")) {
    if (cancel_line) *cancel_line = lines.back();
    lines.pop_back();
  }

  std::vector<WindowMatch> matches;
  for (const auto& line : lines) {
    WindowMatch match;
    if (ParseOptionLine(line, &match)) {
      matches.push_back(std::move(match));
    } else {
      SNAPBRIDGE_LOG_DEBUG("Skipping unrecognized window list line: {}", line);
    }
  }
  return matches;
}

CaptureResult ParseCaptureOutput(const ProcessOutput& output,
                                 OutputMode mode) {
  const std::string combined = output.stdout_data + output.stderr_data;

  size_t multi = combined.find(kMarkerMultipleWindows);
  if (multi != std::string::npos) {
    size_t term_start = multi + strlen(kMarkerMultipleWindows);
    size_t term_end = combined.find(':', term_start);
    if (term_end != std::string::npos && term_end > term_start) {
      size_t list_start = term_end + 1;
      size_t list_end = combined.find(kMarkerDebug, list_start);
      if (list_end == std::string::npos) list_end = combined.size();

      CaptureResult result = MakeResult(CaptureResult::Kind::kAmbiguous);
      result.ambiguous.search_term = TrimWhitespace(
          combined.substr(term_start, term_end - term_start));
      result.ambiguous.matches =
          ParseWindowList(combined.substr(list_start, list_end - list_start),
                          &result.ambiguous.cancel_line);
      result.text = result.ambiguous.search_term;
      if (!result.ambiguous.matches.empty()) return result;
      SNAPBRIDGE_LOG_WARN("MULTIPLE_WINDOWS_FOUND without a usable list");
    }
  }

  size_t pos = combined.find(kMarkerWindowNotFound);
  if (pos != std::string::npos) {
    return MakeResult(CaptureResult::Kind::kWindowNotFound,
                      RestOfLine(combined, pos, strlen(kMarkerWindowNotFound)));
  }
  pos = combined.find(kMarkerProcessNotFound);
  if (pos != std::string::npos) {
    return MakeResult(
        CaptureResult::Kind::kProcessNotFound,
        RestOfLine(combined, pos, strlen(kMarkerProcessNotFound)));
  }

  CaptureResult result;
  if (ParsePayloadOrError(output, combined, &result)) return result;

  if (mode == OutputMode::kFile) {
    return MakeResult(CaptureResult::Kind::kCompleted);
  }
  return MakeResult(CaptureResult::Kind::kParseError,
                    "Failed to generate base64 output from PowerShell");
}

CaptureResult ParseClipboardOutput(const ProcessOutput& output) {
  const std::string& out = output.stdout_data;
  const std::string combined = out + output.stderr_data;

  // Status tokens are only meaningful ahead of the clipboard text itself,
  // which may legitimately contain any of them.
  size_t text_pos = out.find(kMarkerTextContent);
  const std::string head = out.substr(0, text_pos);

  if (Contains(head, kMarkerEmptyClipboard)) {
    return MakeResult(CaptureResult::Kind::kEmptyClipboard);
  }
  if (Contains(head, kMarkerNoText)) {
    return MakeResult(CaptureResult::Kind::kNoTextInClipboard);
  }
  if (Contains(head, kMarkerNoImage)) {
    return MakeResult(CaptureResult::Kind::kNoImageInClipboard);
  }
  if (text_pos != std::string::npos) {
    return MakeResult(
        CaptureResult::Kind::kText,
        TrimWhitespace(out.substr(text_pos + strlen(kMarkerTextContent))));
  }

  CaptureResult result;
  if (ParsePayloadOrError(output, combined, &result)) return result;

  std::string err = TrimWhitespace(output.stderr_data);
  if (!err.empty()) {
    return MakeResult(CaptureResult::Kind::kBridgeFailure, err);
  }
  return MakeResult(CaptureResult::Kind::kParseError,
                    "Unable to read clipboard content");
}

DesktopInventory ParseInventory(const ProcessOutput& output) {
  DesktopInventory inventory;
  bool saw_marker = false;

  for (const auto& raw : SplitLines(output.stdout_data)) {
    const std::string line = TrimWhitespace(raw);
    if (line.compare(0, strlen(kMarkerVirtualScreen), kMarkerVirtualScreen) ==
        0) {
      saw_marker = true;
      auto fields = SplitFields(line, 5);
      Rect rect;
      if (ParseRect(fields, 1, &rect)) {
        inventory.virtual_screen = rect;
      } else {
        SNAPBRIDGE_LOG_DEBUG("Malformed inventory line: {}", line);
      }
    } else if (line.compare(0, strlen(kMarkerMonitor), kMarkerMonitor) == 0) {
      saw_marker = true;
      // MONITOR:x:y:w:h:primary:name
      auto fields = SplitFields(line, 7);
      MonitorInfo monitor;
      int primary = 0;
      if (fields.size() == 7 && ParseRect(fields, 1, &monitor.bounds) &&
          ParseInt(fields[5], &primary)) {
        monitor.is_primary = primary != 0;
        monitor.name = fields[6];
        inventory.monitors.push_back(std::move(monitor));
      } else {
        SNAPBRIDGE_LOG_DEBUG("Malformed inventory line: {}", line);
      }
    } else if (line.compare(0, strlen(kMarkerWindow), kMarkerWindow) == 0) {
      saw_marker = true;
      // WINDOW:handle:x:y:w:h:process:title
      auto fields = SplitFields(line, 8);
      WindowMatch window;
      int64_t handle = 0;
      if (fields.size() == 8 && ParseInt64(fields[1], &handle) &&
          ParseRect(fields, 2, &window.bounds)) {
        window.handle = static_cast<uint64_t>(handle);
        window.process_name = fields[6];
        window.title = fields[7];
        inventory.windows.push_back(std::move(window));
      } else {
        SNAPBRIDGE_LOG_DEBUG("Malformed inventory line: {}", line);
      }
    }
  }

  if (saw_marker) {
    SNAPBRIDGE_LOG_DEBUG("Inventory: {} monitor(s), {} window(s)",
                         inventory.monitors.size(), inventory.windows.size());
    return inventory;
  }

  const std::string combined = output.stdout_data + output.stderr_data;
  size_t err = combined.find(kMarkerError);
  if (err != std::string::npos) {
    throw BridgeError(kSnapBridgeErrorBridgeFailure,
                      RestOfLine(combined, err, strlen(kMarkerError)));
  }
  if (output.exit_code != 0) {
    throw BridgeError(kSnapBridgeErrorBridgeFailure, FailureMessage(output));
  }
  throw BridgeError(kSnapBridgeErrorOutputParse,
                    "Bridge returned no desktop inventory");
}

}  // namespace internal
}  // namespace snapbridge
