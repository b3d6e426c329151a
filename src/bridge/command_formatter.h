// Copyright 2026 The snapbridge Authors
//
// Renders bridge requests as PowerShell scripts wrapped in immutable
// BridgeCommand values.  This is the only place caller-supplied text is
// embedded into a script.

#ifndef SNAPBRIDGE_BRIDGE_COMMAND_FORMATTER_H_
#define SNAPBRIDGE_BRIDGE_COMMAND_FORMATTER_H_

#include <string>
#include <vector>

#include "bridge/bridge_command.h"
#include "capture/capture_types.h"

namespace snapbridge {
namespace internal {

class CommandFormatter {
 public:
  explicit CommandFormatter(std::string program = "powershell.exe",
                            int settle_delay_ms = 200);

  /// Enumerate virtual-screen bounds and monitors, plus visible titled
  /// windows when `include_windows` is set.
  BridgeCommand Inventory(bool include_windows) const;

  /// Capture a resolved target.  Direct mode prints "BASE64:<png>"; File
  /// mode saves a PNG to `destination` (a drive-letter path).
  BridgeCommand Capture(const CaptureTarget& target, OutputMode mode,
                        const std::string& destination) const;

  /// Read the clipboard in the requested format.
  BridgeCommand Clipboard(ClipboardFormat format) const;

  const std::string& program() const { return program_; }
  int settle_delay_ms() const { return settle_delay_ms_; }

 private:
  BridgeCommand Wrap(const std::string& body) const;

  std::string program_;
  int settle_delay_ms_;
};

/// PowerShell single-quoted literal.  Quote characters (' and the Unicode
/// variants PowerShell also treats as quotes) are doubled; NULs dropped.
std::string QuotePowerShell(const std::string& value);

/// base64(UTF-16LE(script)), the form -EncodedCommand expects.
std::string EncodeScript(const std::string& script);

/// Inverse of EncodeScript().  Returns an empty string for invalid input.
std::string DecodeScript(const std::string& encoded);

/// UTF-8 -> UTF-16LE bytes.  Malformed sequences become U+FFFD.
std::string Utf8ToUtf16Le(const std::string& utf8);

/// UTF-16LE bytes -> UTF-8.  Unpaired surrogates become U+FFFD.
std::string Utf16LeToUtf8(const std::string& utf16);

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_BRIDGE_COMMAND_FORMATTER_H_
