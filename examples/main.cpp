// Copyright 2026 The snapbridge Authors
//
// snapbridge -- capture Windows monitors, windows and the clipboard from WSL.
// Status and text payloads go to stdout; images go to --out, or to stdout as
// base64 when --out is not given.  Diagnostics go to stderr.

#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <argparse/argparse.hpp>

#include "snapbridge/snapbridge.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

bool WriteFile(const std::string& path, const snapbridge::Result& result) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(reinterpret_cast<const char*>(result.image_data()),
            static_cast<std::streamsize>(result.image_size()));
  return static_cast<bool>(out);
}

int EmitResult(const snapbridge::Result& result, const std::string& out_path) {
  std::cout << result.text() << "\n";
  if (!result.has_image()) return kExitOk;

  if (out_path.empty()) {
    std::cout << result.image_base64() << "\n";
    return kExitOk;
  }
  if (!WriteFile(out_path, result)) {
    std::cerr << "snapbridge: cannot write " << out_path << "\n";
    return kExitFailure;
  }
  snapbridge_log(kSnapBridgeLogInfo,
                 ("Wrote " + std::to_string(result.image_size()) +
                  " bytes to " + out_path)
                     .c_str());
  return kExitOk;
}

std::optional<SnapBridgeClipboardFormat> ParseFormat(const std::string& name) {
  if (name == "auto") return kSnapBridgeClipboardAuto;
  if (name == "text") return kSnapBridgeClipboardText;
  if (name == "image") return kSnapBridgeClipboardImage;
  return std::nullopt;
}

}  // namespace

int main(int argc, char** argv) {
  argparse::ArgumentParser program("snapbridge", SNAPBRIDGE_VERSION_STRING);
  program.add_description(
      "Capture Windows screens, windows and the clipboard from WSL.");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging on stderr");

  argparse::ArgumentParser screenshot("screenshot");
  screenshot.add_description("Capture a monitor, the whole desktop or a window");
  screenshot.add_argument("--monitor")
      .default_value(std::string("all"))
      .help("\"all\", \"primary\" or a monitor number (1, 2, ...)");
  screenshot.add_argument("--window-title")
      .default_value(std::string())
      .help("Capture the window whose title contains this text");
  screenshot.add_argument("--process-name")
      .default_value(std::string())
      .help("Capture a window of this process (\"notepad\" or \"notepad.exe\")");
  screenshot.add_argument("--window-index")
      .scan<'i', int>()
      .help("Pick the N-th match when several windows match");
  screenshot.add_argument("--folder")
      .default_value(std::string())
      .help("Destination folder for --file (WSL or Windows path)");
  screenshot.add_argument("--filename")
      .default_value(std::string("screenshot.png"))
      .help("File name for --file");
  screenshot.add_argument("--file")
      .default_value(false)
      .implicit_value(true)
      .help("Save a PNG through Windows instead of returning a JPEG");
  screenshot.add_argument("--quality")
      .default_value(80)
      .scan<'i', int>()
      .help("JPEG quality 1-100 (lowered automatically to fit 950KB)");
  screenshot.add_argument("--out")
      .default_value(std::string())
      .help("Write the JPEG here instead of printing base64");

  argparse::ArgumentParser clipboard("clipboard");
  clipboard.add_description("Read the Windows clipboard");
  clipboard.add_argument("--format")
      .default_value(std::string("auto"))
      .help("auto, text or image");
  clipboard.add_argument("--out")
      .default_value(std::string())
      .help("Write an image here instead of printing base64");

  program.add_subparser(screenshot);
  program.add_subparser(clipboard);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    std::cerr << err.what() << "\n" << program;
    return kExitUsage;
  }

  if (!program.is_subcommand_used(screenshot) &&
      !program.is_subcommand_used(clipboard)) {
    std::cerr << program;
    return kExitUsage;
  }

  std::optional<SnapBridgeClipboardFormat> format;
  if (program.is_subcommand_used(clipboard)) {
    format = ParseFormat(clipboard.get<std::string>("--format"));
    if (!format) {
      std::cerr << "snapbridge: --format must be auto, text or image\n";
      return kExitUsage;
    }
  }

  try {
    snapbridge::Context ctx;
    // After the context, so it wins over a settings-file log_level.
    if (program.get<bool>("--verbose")) {
      snapbridge::set_log_level(kSnapBridgeLogDebug);
    }

    if (format) {
      auto result = ctx.ReadClipboard(*format);
      return EmitResult(result, clipboard.get<std::string>("--out"));
    }

    snapbridge::ScreenshotOptions opts;
    opts.monitor = screenshot.get<std::string>("--monitor");
    opts.window_title = screenshot.get<std::string>("--window-title");
    opts.process_name = screenshot.get<std::string>("--process-name");
    opts.window_index = screenshot.present<int>("--window-index");
    opts.folder = screenshot.get<std::string>("--folder");
    opts.filename = screenshot.get<std::string>("--filename");
    opts.return_direct = !screenshot.get<bool>("--file");
    opts.quality = screenshot.get<int>("--quality");

    auto result = ctx.TakeScreenshot(opts);
    return EmitResult(result, screenshot.get<std::string>("--out"));
  } catch (const snapbridge::Error& e) {
    std::cerr << e.what() << "\n";
    return kExitFailure;
  }
}
