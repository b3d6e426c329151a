// Copyright 2026 The snapbridge Authors

#include "bridge/command_formatter.h"

#include <cstdint>
#include <sstream>
#include <utility>

#include "core/base64.h"
#include "core/logger.h"

namespace snapbridge {
namespace internal {

namespace {

// ---------------------------------------------------------------------------
// Script fragments.  Here-string terminators ("@) must start a line.
// ---------------------------------------------------------------------------

constexpr char kPrelude[] = R"PS($ErrorActionPreference = 'Stop'
[Console]::OutputEncoding = [System.Text.Encoding]::UTF8
Add-Type -AssemblyName System.Windows.Forms
Add-Type -AssemblyName System.Drawing
Add-Type @"
using System;
using System.Runtime.InteropServices;
public class SnapBridgeDpi {
  [DllImport("shcore.dll")]
  public static extern int SetProcessDpiAwareness(int value);
  [DllImport("user32.dll")]
  public static extern bool SetProcessDPIAware();
}
"@
# Per-monitor DPI awareness keeps rectangles exact on mixed-scaling setups.
try { [SnapBridgeDpi]::SetProcessDpiAwareness(2) | Out-Null } catch { [SnapBridgeDpi]::SetProcessDPIAware() | Out-Null }
)PS";

constexpr char kMonitorInventory[] = R"PS($vs = [System.Windows.Forms.SystemInformation]::VirtualScreen
Write-Output ('VIRTUAL_SCREEN:{0}:{1}:{2}:{3}' -f $vs.Left, $vs.Top, $vs.Width, $vs.Height)
foreach ($screen in [System.Windows.Forms.Screen]::AllScreens) {
  $b = $screen.Bounds
  $primary = if ($screen.Primary) { 1 } else { 0 }
  Write-Output ('MONITOR:{0}:{1}:{2}:{3}:{4}:{5}' -f $b.X, $b.Y, $b.Width, $b.Height, $primary, $screen.DeviceName)
}
)PS";

constexpr char kWindowInventory[] = R"PS(Add-Type @"
using System;
using System.Collections.Generic;
using System.Diagnostics;
using System.Runtime.InteropServices;
using System.Text;
public class SnapBridgeWindows {
  public delegate bool EnumWindowsProc(IntPtr hWnd, IntPtr lParam);
  [DllImport("user32.dll")]
  public static extern bool EnumWindows(EnumWindowsProc enumProc, IntPtr lParam);
  [DllImport("user32.dll", CharSet = CharSet.Unicode)]
  public static extern int GetWindowText(IntPtr hWnd, StringBuilder text, int count);
  [DllImport("user32.dll")]
  public static extern bool IsWindowVisible(IntPtr hWnd);
  [DllImport("user32.dll")]
  public static extern uint GetWindowThreadProcessId(IntPtr hWnd, out uint processId);
  [DllImport("user32.dll")]
  public static extern bool GetWindowRect(IntPtr hWnd, out RECT rect);
  public struct RECT { public int Left; public int Top; public int Right; public int Bottom; }
  public static List<string> Describe() {
    List<string> lines = new List<string>();
    EnumWindows(delegate (IntPtr hWnd, IntPtr lParam) {
      if (!IsWindowVisible(hWnd)) return true;
      StringBuilder title = new StringBuilder(512);
      GetWindowText(hWnd, title, title.Capacity);
      if (title.Length == 0) return true;
      uint pid;
      GetWindowThreadProcessId(hWnd, out pid);
      string process;
      try { process = Process.GetProcessById((int)pid).ProcessName + ".exe"; }
      catch (Exception) { return true; }
      RECT r;
      GetWindowRect(hWnd, out r);
      string text = title.ToString().Replace("\r", " ").Replace("\n", " ");
      lines.Add(string.Format("WINDOW:{0}:{1}:{2}:{3}:{4}:{5}:{6}",
          hWnd.ToInt64(), r.Left, r.Top, r.Right - r.Left, r.Bottom - r.Top,
          process.Replace(":", "_"), text));
      return true;
    }, IntPtr.Zero);
    return lines;
  }
}
"@
foreach ($line in [SnapBridgeWindows]::Describe()) { Write-Output $line }
)PS";

constexpr char kWindowInterop[] = R"PS(Add-Type @"
using System;
using System.Runtime.InteropServices;
public class SnapBridgeWindow {
  [DllImport("user32.dll")]
  public static extern bool IsWindow(IntPtr hWnd);
  [DllImport("user32.dll")]
  public static extern bool GetWindowRect(IntPtr hWnd, out RECT rect);
  [DllImport("user32.dll")]
  public static extern bool SetForegroundWindow(IntPtr hWnd);
  public struct RECT { public int Left; public int Top; public int Right; public int Bottom; }
}
"@
)PS";

constexpr char kGrab[] = R"PS($bitmap = New-Object System.Drawing.Bitmap $width, $height
$graphics = [System.Drawing.Graphics]::FromImage($bitmap)
$graphics.CopyFromScreen($left, $top, 0, 0, $bitmap.Size)
$graphics.Dispose()
)PS";

constexpr char kEmitBase64[] = R"PS($ms = New-Object System.IO.MemoryStream
$bitmap.Save($ms, [System.Drawing.Imaging.ImageFormat]::Png)
Write-Output ('BASE64:' + [Convert]::ToBase64String($ms.ToArray()))
$ms.Dispose()
$bitmap.Dispose()
)PS";

constexpr char kClipboardBody[] = R"PS($hasText = [System.Windows.Forms.Clipboard]::ContainsText()
$hasImage = [System.Windows.Forms.Clipboard]::ContainsImage()
if ($format -eq 'auto') {
  if ($hasImage) { $format = 'image' }
  elseif ($hasText) { $format = 'text' }
  else { Write-Output 'EMPTY_CLIPBOARD'; exit 0 }
}
if ($format -eq 'text') {
  if (-not $hasText) { Write-Output 'NO_TEXT_IN_CLIPBOARD'; exit 0 }
  $text = Get-Clipboard -Raw
  if ($null -eq $text) { Write-Output 'EMPTY_CLIPBOARD'; exit 0 }
  Write-Output ('TEXT_CONTENT:' + $text)
} elseif ($format -eq 'image') {
  if (-not $hasImage) { Write-Output 'NO_IMAGE_IN_CLIPBOARD'; exit 0 }
  $image = [System.Windows.Forms.Clipboard]::GetImage()
  if ($null -eq $image) { Write-Output 'NO_IMAGE_IN_CLIPBOARD'; exit 0 }
  $ms = New-Object System.IO.MemoryStream
  $image.Save($ms, [System.Drawing.Imaging.ImageFormat]::Png)
  Write-Output ('BASE64:' + [Convert]::ToBase64String($ms.ToArray()))
  $ms.Dispose()
  $image.Dispose()
}
)PS";

const char* ClipboardFormatName(ClipboardFormat format) {
  switch (format) {
    case ClipboardFormat::kText:  return "text";
    case ClipboardFormat::kImage: return "image";
    default:                      return "auto";
  }
}

void AppendUtf16(uint32_t cp, std::string* out) {
  auto put = [out](uint32_t unit) {
    out->push_back(static_cast<char>(unit & 0xFF));
    out->push_back(static_cast<char>((unit >> 8) & 0xFF));
  };
  if (cp < 0x10000) {
    put(cp);
  } else {
    cp -= 0x10000;
    put(0xD800 + (cp >> 10));
    put(0xDC00 + (cp & 0x3FF));
  }
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

constexpr uint32_t kReplacementChar = 0xFFFD;

}  // namespace

// ---------------------------------------------------------------------------
// Quoting and encoding
// ---------------------------------------------------------------------------

std::string QuotePowerShell(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '\0') continue;
    if (c == '\'') {
      out += "''";
      continue;
    }
    // U+2018..U+201B encode as E2 80 98..9B.
    if (static_cast<unsigned char>(c) == 0xE2 && i + 2 < value.size() &&
        static_cast<unsigned char>(value[i + 1]) == 0x80) {
      unsigned char third = static_cast<unsigned char>(value[i + 2]);
      if (third >= 0x98 && third <= 0x9B) {
        std::string quote = value.substr(i, 3);
        out += quote;
        out += quote;
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string Utf8ToUtf16Le(const std::string& utf8) {
  std::string out;
  out.reserve(utf8.size() * 2);
  size_t i = 0;
  while (i < utf8.size()) {
    unsigned char c = static_cast<unsigned char>(utf8[i]);
    uint32_t cp = kReplacementChar;
    size_t len = 1;
    if (c < 0x80) {
      cp = c;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
    }

    if (len > 1) {
      bool valid = i + len <= utf8.size();
      uint32_t value = c & (0xFF >> (len + 1));
      for (size_t k = 1; valid && k < len; ++k) {
        unsigned char cc = static_cast<unsigned char>(utf8[i + k]);
        if ((cc & 0xC0) != 0x80) {
          valid = false;
          break;
        }
        value = (value << 6) | (cc & 0x3F);
      }
      static const uint32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
      if (valid && value >= kMinForLength[len] && value <= 0x10FFFF &&
          (value < 0xD800 || value > 0xDFFF)) {
        cp = value;
      } else {
        len = 1;
      }
    }
    AppendUtf16(cp, &out);
    i += len;
  }
  return out;
}

std::string Utf16LeToUtf8(const std::string& utf16) {
  std::string out;
  out.reserve(utf16.size() / 2);
  auto unit_at = [&utf16](size_t i) {
    return static_cast<uint32_t>(static_cast<unsigned char>(utf16[i])) |
           (static_cast<uint32_t>(static_cast<unsigned char>(utf16[i + 1]))
            << 8);
  };
  size_t i = 0;
  while (i + 1 < utf16.size()) {
    uint32_t unit = unit_at(i);
    i += 2;
    if (unit >= 0xD800 && unit <= 0xDBFF) {
      if (i + 1 < utf16.size()) {
        uint32_t low = unit_at(i);
        if (low >= 0xDC00 && low <= 0xDFFF) {
          i += 2;
          AppendUtf8(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00), &out);
          continue;
        }
      }
      AppendUtf8(kReplacementChar, &out);
    } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
      AppendUtf8(kReplacementChar, &out);
    } else {
      AppendUtf8(unit, &out);
    }
  }
  return out;
}

std::string EncodeScript(const std::string& script) {
  std::string utf16 = Utf8ToUtf16Le(script);
  return Base64Encode(reinterpret_cast<const uint8_t*>(utf16.data()),
                      utf16.size());
}

std::string DecodeScript(const std::string& encoded) {
  std::vector<uint8_t> bytes;
  if (!Base64Decode(encoded, &bytes) || bytes.size() % 2 != 0) {
    return std::string();
  }
  return Utf16LeToUtf8(std::string(bytes.begin(), bytes.end()));
}

// ---------------------------------------------------------------------------
// CommandFormatter
// ---------------------------------------------------------------------------

CommandFormatter::CommandFormatter(std::string program, int settle_delay_ms)
    : program_(std::move(program)), settle_delay_ms_(settle_delay_ms) {}

BridgeCommand CommandFormatter::Wrap(const std::string& body) const {
  std::string script;
  script.reserve(sizeof(kPrelude) + body.size() + 96);
  script += "try {\n";
  script += kPrelude;
  script += body;
  script += "} catch {\n  Write-Output \"ERROR: $_\"\n  exit 1\n}\n";

  std::vector<std::string> args = {
      "-ExecutionPolicy", "Bypass",     "-NoProfile",
      "-NonInteractive",  "-OutputFormat", "Text",
      "-EncodedCommand",  EncodeScript(script)};
  SNAPBRIDGE_LOG_TRACE("Bridge script:\n{}", script);
  return BridgeCommand(program_, std::move(args), std::move(script));
}

BridgeCommand CommandFormatter::Inventory(bool include_windows) const {
  std::string body = kMonitorInventory;
  if (include_windows) body += kWindowInventory;
  return Wrap(body);
}

BridgeCommand CommandFormatter::Capture(const CaptureTarget& target,
                                        OutputMode mode,
                                        const std::string& destination) const {
  std::ostringstream body;
  if (target.kind == CaptureTarget::Kind::kWindow) {
    const char* marker = target.query_kind == QueryKind::kProcess
                             ? "PROCESS_NOT_FOUND:"
                             : "WINDOW_NOT_FOUND:";
    body << kWindowInterop
         << "$hwnd = [IntPtr]::new([Int64]"
         << static_cast<int64_t>(target.window_handle) << ")\n"
         << "if (-not [SnapBridgeWindow]::IsWindow($hwnd)) {\n"
         << "  [Console]::Error.WriteLine("
         << QuotePowerShell(marker + target.search_term) << ")\n"
         << "  exit 1\n"
         << "}\n"
         << "[SnapBridgeWindow]::SetForegroundWindow($hwnd) | Out-Null\n"
         << "Start-Sleep -Milliseconds " << settle_delay_ms_ << "\n"
         << "$rect = New-Object SnapBridgeWindow+RECT\n"
         << "[SnapBridgeWindow]::GetWindowRect($hwnd, [ref]$rect) | Out-Null\n"
         << "$left = $rect.Left\n"
         << "$top = $rect.Top\n"
         << "$width = $rect.Right - $rect.Left\n"
         << "$height = $rect.Bottom - $rect.Top\n"
         << "if ($width -le 0 -or $height -le 0) { throw "
         << QuotePowerShell("Window has no visible area") << " }\n";
  } else {
    body << "$left = " << target.bounds.x << "\n"
         << "$top = " << target.bounds.y << "\n"
         << "$width = " << target.bounds.width << "\n"
         << "$height = " << target.bounds.height << "\n";
  }

  body << kGrab;
  if (mode == OutputMode::kDirect) {
    body << kEmitBase64;
  } else {
    body << "$bitmap.Save(" << QuotePowerShell(destination)
         << ", [System.Drawing.Imaging.ImageFormat]::Png)\n"
         << "$bitmap.Dispose()\n";
  }
  return Wrap(body.str());
}

BridgeCommand CommandFormatter::Clipboard(ClipboardFormat format) const {
  std::string body = "$format = ";
  body += QuotePowerShell(ClipboardFormatName(format));
  body += "\n";
  body += kClipboardBody;
  return Wrap(body);
}

}  // namespace internal
}  // namespace snapbridge
