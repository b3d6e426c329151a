// Copyright 2026 The snapbridge Authors
// Tests for: CommandFormatter, QuotePowerShell, EncodeScript, DecodeScript

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "bridge/command_formatter.h"

using snapbridge::internal::BridgeCommand;
using snapbridge::internal::CaptureTarget;
using snapbridge::internal::ClipboardFormat;
using snapbridge::internal::CommandFormatter;
using snapbridge::internal::DecodeScript;
using snapbridge::internal::EncodeScript;
using snapbridge::internal::OutputMode;
using snapbridge::internal::QueryKind;
using snapbridge::internal::QuotePowerShell;
using snapbridge::internal::Utf16LeToUtf8;
using snapbridge::internal::Utf8ToUtf16Le;

namespace {

bool Has(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

CaptureTarget RegionTarget() {
  CaptureTarget t;
  t.kind = CaptureTarget::Kind::kRegion;
  t.bounds = {-1920, 0, 3840, 1080};
  return t;
}

CaptureTarget WindowTarget(QueryKind kind, const std::string& term) {
  CaptureTarget t;
  t.kind = CaptureTarget::Kind::kWindow;
  t.bounds = {10, 20, 800, 600};
  t.window_handle = 132456;
  t.query_kind = kind;
  t.search_term = term;
  return t;
}

}  // namespace

// ---------------------------------------------------------------------------
// Quoting
// ---------------------------------------------------------------------------

TEST(QuotePowerShellTest, PlainText) {
  EXPECT_EQ(QuotePowerShell("Notepad"), "'Notepad'");
  EXPECT_EQ(QuotePowerShell(""), "''");
}

TEST(QuotePowerShellTest, DoublesSingleQuotes) {
  EXPECT_EQ(QuotePowerShell("it's"), "'it''s'");
}

TEST(QuotePowerShellTest, HostileInputStaysInsideLiteral) {
  const std::string hostile = "'; Remove-Item -Recurse C:\\ ; '";
  const std::string quoted = QuotePowerShell(hostile);
  EXPECT_EQ(quoted, "'''; Remove-Item -Recurse C:\\ ; '''");

  // Every quote inside the literal is part of a doubled pair.
  std::string inner = quoted.substr(1, quoted.size() - 2);
  for (size_t i = 0; i < inner.size(); ++i) {
    if (inner[i] == '\'') {
      ASSERT_LT(i + 1, inner.size());
      EXPECT_EQ(inner[i + 1], '\'');
      ++i;
    }
  }
}

TEST(QuotePowerShellTest, DoublesUnicodeQuoteVariants) {
  // U+2018 and U+2019.
  const std::string left = "\xE2\x80\x98";
  const std::string right = "\xE2\x80\x99";
  EXPECT_EQ(QuotePowerShell("a" + left + "b" + right),
            "'a" + left + left + "b" + right + right + "'");
  // U+201C is a double quote and must pass through unchanged.
  const std::string dq = "\xE2\x80\x9C";
  EXPECT_EQ(QuotePowerShell(dq), "'" + dq + "'");
}

TEST(QuotePowerShellTest, DropsNul) {
  std::string with_nul("ab", 2);
  with_nul.push_back('\0');
  with_nul += "c";
  EXPECT_EQ(QuotePowerShell(with_nul), "'abc'");
}

TEST(QuotePowerShellTest, DollarSignsAreInert) {
  EXPECT_EQ(QuotePowerShell("$(Stop-Computer)"), "'$(Stop-Computer)'");
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

TEST(EncodeScriptTest, Utf16LittleEndian) {
  EXPECT_EQ(Utf8ToUtf16Le("A"), std::string("A\0", 2));
  EXPECT_EQ(Utf8ToUtf16Le("\xE2\x82\xAC"), std::string("\xAC\x20", 2));
  // U+1F600 becomes the surrogate pair D83D DE00.
  EXPECT_EQ(Utf8ToUtf16Le("\xF0\x9F\x98\x80"),
            std::string("\x3D\xD8\x00\xDE", 4));
}

TEST(EncodeScriptTest, MalformedUtf8BecomesReplacement) {
  EXPECT_EQ(Utf8ToUtf16Le("\xFF"), std::string("\xFD\xFF", 2));
}

TEST(EncodeScriptTest, KnownEncoding) {
  // "ab" -> 61 00 62 00 -> YQBiAA==
  EXPECT_EQ(EncodeScript("ab"), "YQBiAA==");
}

TEST(EncodeScriptTest, DecodeReturnsOriginalScript) {
  const std::string script =
      "Write-Output 'R\xC3\xA9sum\xC3\xA9 \xE6\x97\xA5\xE6\x9C\xAC "
      "\xF0\x9F\x98\x80'\r\n$x = 1";
  EXPECT_EQ(DecodeScript(EncodeScript(script)), script);
  EXPECT_EQ(Utf16LeToUtf8(Utf8ToUtf16Le(script)), script);
}

TEST(EncodeScriptTest, DecodeRejectsGarbage) {
  EXPECT_EQ(DecodeScript("not base64!!"), "");
}

// ---------------------------------------------------------------------------
// Command shape
// ---------------------------------------------------------------------------

TEST(CommandFormatterTest, ArgumentsCarryEncodedScript) {
  CommandFormatter formatter("pwsh-test.exe");
  BridgeCommand cmd = formatter.Inventory(false);

  EXPECT_EQ(cmd.program(), "pwsh-test.exe");
  const std::vector<std::string> expected_prefix = {
      "-ExecutionPolicy", "Bypass", "-NoProfile", "-NonInteractive",
      "-OutputFormat",    "Text",   "-EncodedCommand"};
  ASSERT_EQ(cmd.arguments().size(), expected_prefix.size() + 1);
  for (size_t i = 0; i < expected_prefix.size(); ++i) {
    EXPECT_EQ(cmd.arguments()[i], expected_prefix[i]);
  }
  EXPECT_EQ(DecodeScript(cmd.arguments().back()), cmd.script());
}

TEST(CommandFormatterTest, ScriptsShareWrapperAndPrelude) {
  CommandFormatter formatter;
  for (const auto& cmd :
       {formatter.Inventory(true), formatter.Clipboard(ClipboardFormat::kAuto),
        formatter.Capture(RegionTarget(), OutputMode::kDirect, "")}) {
    const std::string& s = cmd.script();
    EXPECT_EQ(s.rfind("try {", 0), 0u);
    EXPECT_TRUE(Has(s, "Write-Output \"ERROR: $_\""));
    EXPECT_TRUE(Has(s, "exit 1"));
    EXPECT_TRUE(Has(s, "[Console]::OutputEncoding"));
    EXPECT_TRUE(Has(s, "SetProcessDpiAwareness(2)"));
    EXPECT_TRUE(Has(s, "SetProcessDPIAware()"));
    // DPI awareness is requested before anything is measured.
    size_t grab = s.find("CopyFromScreen");
    if (grab != std::string::npos) {
      EXPECT_LT(s.find("SetProcessDpiAwareness(2)"), grab);
    }
  }
}

TEST(CommandFormatterTest, InventoryWindowsOnlyWhenRequested) {
  CommandFormatter formatter;
  std::string monitors_only = formatter.Inventory(false).script();
  std::string with_windows = formatter.Inventory(true).script();
  EXPECT_TRUE(Has(monitors_only, "VIRTUAL_SCREEN:"));
  EXPECT_TRUE(Has(monitors_only, "MONITOR:"));
  EXPECT_FALSE(Has(monitors_only, "EnumWindows"));
  EXPECT_TRUE(Has(with_windows, "EnumWindows"));
  EXPECT_TRUE(Has(with_windows, "WINDOW:"));
}

TEST(CommandFormatterTest, DirectCaptureEmitsBase64) {
  CommandFormatter formatter;
  std::string s =
      formatter.Capture(RegionTarget(), OutputMode::kDirect, "").script();
  EXPECT_TRUE(Has(s, "$left = -1920"));
  EXPECT_TRUE(Has(s, "$width = 3840"));
  EXPECT_TRUE(Has(s, "$height = 1080"));
  EXPECT_TRUE(Has(s, "'BASE64:'"));
  EXPECT_FALSE(Has(s, "$bitmap.Save('"));
}

TEST(CommandFormatterTest, FileCaptureQuotesDestination) {
  CommandFormatter formatter;
  std::string s = formatter
                      .Capture(RegionTarget(), OutputMode::kFile,
                               "C:\\shots\\it's.png")
                      .script();
  EXPECT_TRUE(Has(s, "$bitmap.Save('C:\\shots\\it''s.png'"));
  EXPECT_FALSE(Has(s, "'BASE64:'"));
}

TEST(CommandFormatterTest, WindowCaptureRaisesAndSettles) {
  CommandFormatter formatter("powershell.exe", 350);
  std::string s = formatter
                      .Capture(WindowTarget(QueryKind::kTitle, "Note'pad"),
                               OutputMode::kDirect, "")
                      .script();
  EXPECT_TRUE(Has(s, "[Int64]132456"));
  EXPECT_TRUE(Has(s, "SetForegroundWindow"));
  EXPECT_TRUE(Has(s, "Start-Sleep -Milliseconds 350"));
  EXPECT_TRUE(Has(s, "'WINDOW_NOT_FOUND:Note''pad'"));
  // The rectangle is read again after the window is raised.
  EXPECT_LT(s.find("SetForegroundWindow($hwnd)"), s.find("GetWindowRect($hwnd"));
}

TEST(CommandFormatterTest, ProcessCaptureReportsProcessNotFound) {
  CommandFormatter formatter;
  std::string s = formatter
                      .Capture(WindowTarget(QueryKind::kProcess, "chrome"),
                               OutputMode::kDirect, "")
                      .script();
  EXPECT_TRUE(Has(s, "'PROCESS_NOT_FOUND:chrome'"));
  EXPECT_FALSE(Has(s, "WINDOW_NOT_FOUND"));
}

TEST(CommandFormatterTest, ClipboardFormatIsQuoted) {
  CommandFormatter formatter;
  EXPECT_TRUE(
      Has(formatter.Clipboard(ClipboardFormat::kText).script(), "$format = 'text'"));
  EXPECT_TRUE(Has(formatter.Clipboard(ClipboardFormat::kImage).script(),
                  "$format = 'image'"));
  EXPECT_TRUE(
      Has(formatter.Clipboard(ClipboardFormat::kAuto).script(), "$format = 'auto'"));
}
