// Copyright 2026 The snapbridge Authors
// Tests for: ParseCaptureOutput, ParseClipboardOutput, ParseInventory,
//            ParseWindowList

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "bridge/result_parser.h"
#include "core/bridge_error.h"

using snapbridge::internal::BridgeError;
using snapbridge::internal::CaptureResult;
using snapbridge::internal::DesktopInventory;
using snapbridge::internal::OutputMode;
using snapbridge::internal::ParseCaptureOutput;
using snapbridge::internal::ParseClipboardOutput;
using snapbridge::internal::ParseInventory;
using snapbridge::internal::ParseWindowList;
using snapbridge::internal::ProcessOutput;
using Kind = snapbridge::internal::CaptureResult::Kind;

namespace {

ProcessOutput Out(const std::string& out, const std::string& err = "",
                  int exit_code = 0) {
  ProcessOutput o;
  o.stdout_data = out;
  o.stderr_data = err;
  o.exit_code = exit_code;
  return o;
}

const std::vector<uint8_t> kThreeBytes = {0x00, 0x01, 0x02};  // "AAEC"

}  // namespace

// ---------------------------------------------------------------------------
// Capture output
// ---------------------------------------------------------------------------

TEST(ParseCaptureTest, Base64Payload) {
  auto r = ParseCaptureOutput(Out("BASE64:AAEC\r\n"), OutputMode::kDirect);
  ASSERT_EQ(r.kind, Kind::kImage);
  EXPECT_EQ(r.image_bytes, kThreeBytes);
}

TEST(ParseCaptureTest, Base64TruncatedAtError) {
  auto r = ParseCaptureOutput(Out("BASE64:AAEC\nERROR: late failure\n"),
                              OutputMode::kDirect);
  ASSERT_EQ(r.kind, Kind::kImage);
  EXPECT_EQ(r.image_bytes, kThreeBytes);
}

TEST(ParseCaptureTest, Base64StopsAtTrailingChatter) {
  auto r = ParseCaptureOutput(
      Out("BASE64:AA\r\nEC\r\n#< CLIXML\r\n<Objs Version=\"1.1.0.1\">"),
      OutputMode::kDirect);
  ASSERT_EQ(r.kind, Kind::kImage);
  EXPECT_EQ(r.image_bytes, kThreeBytes);
}

TEST(ParseCaptureTest, InvalidBase64IsParseError) {
  EXPECT_EQ(ParseCaptureOutput(Out("BASE64:A\n"), OutputMode::kDirect).kind,
            Kind::kParseError);
  EXPECT_EQ(ParseCaptureOutput(Out("BASE64:\n"), OutputMode::kDirect).kind,
            Kind::kParseError);
}

TEST(ParseCaptureTest, Base64OnStderrIsIgnored) {
  auto r = ParseCaptureOutput(Out("", "BASE64:AAEC"), OutputMode::kDirect);
  EXPECT_EQ(r.kind, Kind::kParseError);
}

TEST(ParseCaptureTest, MultipleWindowsFound) {
  const std::string out =
      "MULTIPLE_WINDOWS_FOUND:chrome:\n"
      "1. Inbox - Gmail (chrome.exe)\n"
      "#< CLIXML\n"
      "<Objs Version=\"1.1.0.1\" xmlns=\"http://schemas.microsoft.com\">\n"
      "\n"
      "2. Docs: Draft (chrome.exe)\n"
      "3. Cancel capture\n"
      "DEBUG: enumerated 2 windows\n";
  auto r = ParseCaptureOutput(Out("", out, 1), OutputMode::kDirect);
  ASSERT_EQ(r.kind, Kind::kAmbiguous);
  EXPECT_EQ(r.ambiguous.search_term, "chrome");
  ASSERT_EQ(r.ambiguous.matches.size(), 2u);
  EXPECT_EQ(r.ambiguous.matches[0].title, "Inbox - Gmail");
  EXPECT_EQ(r.ambiguous.matches[0].process_name, "chrome.exe");
  EXPECT_EQ(r.ambiguous.matches[1].title, "Docs: Draft");
  EXPECT_EQ(r.ambiguous.cancel_line, "3. Cancel capture");
}

TEST(ParseCaptureTest, MultipleTakesPrecedence) {
  const std::string out =
      "WINDOW_NOT_FOUND:x\n"
      "MULTIPLE_WINDOWS_FOUND:code:\n1. a (code.exe)\n2. b (code.exe)\n";
  EXPECT_EQ(ParseCaptureOutput(Out(out), OutputMode::kDirect).kind,
            Kind::kAmbiguous);
}

TEST(ParseCaptureTest, WindowNotFound) {
  auto r = ParseCaptureOutput(Out("", "WINDOW_NOT_FOUND:  Notepad \r\n", 1),
                              OutputMode::kDirect);
  ASSERT_EQ(r.kind, Kind::kWindowNotFound);
  EXPECT_EQ(r.text, "Notepad");
}

TEST(ParseCaptureTest, ProcessNotFound) {
  auto r = ParseCaptureOutput(Out("PROCESS_NOT_FOUND:chrome\n", "", 1),
                              OutputMode::kFile);
  ASSERT_EQ(r.kind, Kind::kProcessNotFound);
  EXPECT_EQ(r.text, "chrome");
}

TEST(ParseCaptureTest, ErrorMarker) {
  auto r = ParseCaptureOutput(
      Out("ERROR: A generic error occurred in GDI+.\nAt line:1\n", "", 1),
      OutputMode::kFile);
  ASSERT_EQ(r.kind, Kind::kError);
  EXPECT_EQ(r.text, "A generic error occurred in GDI+.");
}

TEST(ParseCaptureTest, FailureWithoutMarkerUsesStderr) {
  auto r = ParseCaptureOutput(Out("", "  powershell.exe: not found\n", 127),
                              OutputMode::kDirect);
  ASSERT_EQ(r.kind, Kind::kBridgeFailure);
  EXPECT_EQ(r.text, "powershell.exe: not found");
}

TEST(ParseCaptureTest, FailureWithoutAnyOutputIsSynthesized) {
  auto r = ParseCaptureOutput(Out("", "", 5), OutputMode::kDirect);
  ASSERT_EQ(r.kind, Kind::kBridgeFailure);
  EXPECT_NE(r.text.find("5"), std::string::npos);
}

TEST(ParseCaptureTest, CleanExitWithoutMarker) {
  EXPECT_EQ(ParseCaptureOutput(Out(""), OutputMode::kFile).kind,
            Kind::kCompleted);
  auto direct = ParseCaptureOutput(Out(""), OutputMode::kDirect);
  EXPECT_EQ(direct.kind, Kind::kParseError);
  EXPECT_EQ(direct.text, "Failed to generate base64 output from PowerShell");
}

// ---------------------------------------------------------------------------
// Window list
// ---------------------------------------------------------------------------

TEST(ParseWindowListTest, TitleWithParentheses) {
  std::string cancel;
  auto matches = ParseWindowList(
      "1. Foo (draft) - Editor (editor.exe)\n2. Untitled\n", &cancel);
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].title, "Foo (draft) - Editor");
  EXPECT_EQ(matches[0].process_name, "editor.exe");
  EXPECT_EQ(matches[1].title, "Untitled");
  EXPECT_EQ(matches[1].process_name, "");
  EXPECT_EQ(cancel, "");
}

TEST(ParseWindowListTest, DropsClixmlFraming) {
  std::string cancel;
  auto matches = ParseWindowList(
      "<Objs>\n<Obj S=\"progress\">\n1. A (a.exe)\n</Obj>\n</Objs>\n"
      "2. B (b.exe)\n3. Cancel capture",
      &cancel);
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(cancel, "3. Cancel capture");
}

// ---------------------------------------------------------------------------
// Clipboard output
// ---------------------------------------------------------------------------

TEST(ParseClipboardTest, StatusTokens) {
  EXPECT_EQ(ParseClipboardOutput(Out("EMPTY_CLIPBOARD\n")).kind,
            Kind::kEmptyClipboard);
  EXPECT_EQ(ParseClipboardOutput(Out("NO_TEXT_IN_CLIPBOARD\n")).kind,
            Kind::kNoTextInClipboard);
  EXPECT_EQ(ParseClipboardOutput(Out("NO_IMAGE_IN_CLIPBOARD\n")).kind,
            Kind::kNoImageInClipboard);
}

TEST(ParseClipboardTest, TextContentRunsToEnd) {
  auto r = ParseClipboardOutput(Out("TEXT_CONTENT:  line one\r\nline two\r\n"));
  ASSERT_EQ(r.kind, Kind::kText);
  EXPECT_EQ(r.text, "line one\r\nline two");
}

TEST(ParseClipboardTest, TextMayContainStatusTokens) {
  auto r = ParseClipboardOutput(
      Out("TEXT_CONTENT:grep EMPTY_CLIPBOARD and BASE64:AAEC\n"));
  ASSERT_EQ(r.kind, Kind::kText);
  EXPECT_EQ(r.text, "grep EMPTY_CLIPBOARD and BASE64:AAEC");
}

TEST(ParseClipboardTest, ImagePayload) {
  auto r = ParseClipboardOutput(Out("BASE64:AAEC\n"));
  ASSERT_EQ(r.kind, Kind::kImage);
  EXPECT_EQ(r.image_bytes, kThreeBytes);
}

TEST(ParseClipboardTest, ErrorsAndFallback) {
  auto err = ParseClipboardOutput(Out("ERROR: Clipboard busy\n", "", 1));
  ASSERT_EQ(err.kind, Kind::kError);
  EXPECT_EQ(err.text, "Clipboard busy");

  auto failure = ParseClipboardOutput(Out("", "something broke\n", 0));
  ASSERT_EQ(failure.kind, Kind::kBridgeFailure);
  EXPECT_EQ(failure.text, "something broke");

  auto nothing = ParseClipboardOutput(Out(""));
  ASSERT_EQ(nothing.kind, Kind::kParseError);
  EXPECT_EQ(nothing.text, "Unable to read clipboard content");
}

// ---------------------------------------------------------------------------
// Inventory
// ---------------------------------------------------------------------------

TEST(ParseInventoryTest, MonitorsAndWindows) {
  const std::string out =
      "VIRTUAL_SCREEN:-1920:0:3840:1080\r\n"
      "MONITOR:0:0:1920:1080:1:\\\\.\\DISPLAY1\r\n"
      "MONITOR:-1920:0:1920:1080:0:\\\\.\\DISPLAY2\r\n"
      "WINDOW:132456:10:20:800:600:notepad.exe:notes.txt - Notepad\r\n"
      "WINDOW:99:0:0:100:100:code.exe:C:\\src\\main.cpp: Visual Studio Code\r\n";
  DesktopInventory inv = ParseInventory(Out(out));

  EXPECT_EQ(inv.virtual_screen.x, -1920);
  EXPECT_EQ(inv.virtual_screen.width, 3840);
  ASSERT_EQ(inv.monitors.size(), 2u);
  EXPECT_TRUE(inv.monitors[0].is_primary);
  EXPECT_EQ(inv.monitors[0].name, "\\\\.\\DISPLAY1");
  EXPECT_FALSE(inv.monitors[1].is_primary);
  EXPECT_EQ(inv.monitors[1].bounds.x, -1920);

  ASSERT_EQ(inv.windows.size(), 2u);
  EXPECT_EQ(inv.windows[0].handle, 132456u);
  EXPECT_EQ(inv.windows[0].process_name, "notepad.exe");
  EXPECT_EQ(inv.windows[0].title, "notes.txt - Notepad");
  EXPECT_EQ(inv.windows[0].bounds.height, 600);
  EXPECT_EQ(inv.windows[1].title, "C:\\src\\main.cpp: Visual Studio Code");
}

TEST(ParseInventoryTest, MalformedLinesAreSkipped) {
  const std::string out =
      "MONITOR:0:0:wide:1080:1:X\n"
      "MONITOR:0:0:1920:1080:1:OK\n"
      "WINDOW:notanumber:0:0:1:1:a.exe:t\n"
      "garbage\n";
  DesktopInventory inv = ParseInventory(Out(out));
  ASSERT_EQ(inv.monitors.size(), 1u);
  EXPECT_EQ(inv.monitors[0].name, "OK");
  EXPECT_TRUE(inv.windows.empty());
}

TEST(ParseInventoryTest, ErrorMarkerThrowsBridgeFailure) {
  try {
    ParseInventory(Out("ERROR: Add-Type failed\n", "", 1));
    FAIL() << "expected BridgeError";
  } catch (const BridgeError& e) {
    EXPECT_EQ(e.code(), kSnapBridgeErrorBridgeFailure);
    EXPECT_STREQ(e.what(), "Add-Type failed");
  }
}

TEST(ParseInventoryTest, EmptyOutputThrows) {
  try {
    ParseInventory(Out(""));
    FAIL() << "expected BridgeError";
  } catch (const BridgeError& e) {
    EXPECT_EQ(e.code(), kSnapBridgeErrorOutputParse);
  }
  try {
    ParseInventory(Out("", "exec failed", 127));
    FAIL() << "expected BridgeError";
  } catch (const BridgeError& e) {
    EXPECT_EQ(e.code(), kSnapBridgeErrorBridgeFailure);
    EXPECT_STREQ(e.what(), "exec failed");
  }
}
