// Copyright 2026 The snapbridge Authors

#include "core/snapbridge_context.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <system_error>
#include <utility>

#include "bridge/result_parser.h"
#include "capture/disambiguation_formatter.h"
#include "capture/target_resolver.h"
#include "core/bridge_error.h"
#include "core/logger.h"

namespace snapbridge {
namespace internal {

namespace {

constexpr char kScreenshotFailure[] = "Failed to take screenshot: ";
constexpr char kClipboardFailure[] = "Failed to read clipboard: ";
constexpr char kDefaultFolderName[] = "screenshots";
constexpr int kClipboardQuality = 80;

/// Translate a non-success capture outcome into the matching error.
[[noreturn]] void ThrowForResult(const CaptureResult& result) {
  switch (result.kind) {
    case CaptureResult::Kind::kAmbiguous:
      throw BridgeError(kSnapBridgeErrorAmbiguousTarget,
                        FormatDisambiguation(result.ambiguous));
    case CaptureResult::Kind::kWindowNotFound:
      throw BridgeError(kSnapBridgeErrorWindowNotFound,
                        FormatWindowNotFound(result.text));
    case CaptureResult::Kind::kProcessNotFound:
      throw BridgeError(kSnapBridgeErrorProcessNotFound,
                        FormatProcessNotFound(result.text));
    case CaptureResult::Kind::kError:
    case CaptureResult::Kind::kBridgeFailure:
      throw BridgeError(kSnapBridgeErrorBridgeFailure, result.text);
    case CaptureResult::Kind::kParseError:
      throw BridgeError(kSnapBridgeErrorOutputParse, result.text);
    default:
      throw BridgeError(kSnapBridgeErrorOutputParse,
                        "Unexpected response from PowerShell bridge");
  }
}

void ValidateFilename(const std::string& filename) {
  if (filename.empty() || filename == "." || filename == ".." ||
      filename.find_first_of("/\\") != std::string::npos) {
    throw BridgeError(kSnapBridgeErrorInvalidParam,
                      "Invalid filename '" + filename +
                          "': expected a plain file name");
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// Request conversion
// ---------------------------------------------------------------------------

TargetSpec ParseMonitorSpec(const std::string& monitor) {
  std::string value = AsciiLower(monitor);
  TargetSpec spec;
  if (value.empty() || value == "all") {
    spec.kind = TargetKind::kAllMonitors;
    return spec;
  }
  if (value == "primary") {
    spec.kind = TargetKind::kPrimary;
    return spec;
  }
  if (value.size() <= 9 &&
      std::all_of(value.begin(), value.end(),
                  [](unsigned char c) { return std::isdigit(c) != 0; })) {
    spec.kind = TargetKind::kMonitorIndex;
    spec.monitor_index = std::stoi(value);
    return spec;
  }
  throw BridgeError(kSnapBridgeErrorInvalidParam,
                    "Invalid monitor '" + monitor +
                        "'. Use \"all\", \"primary\" or a monitor number "
                        "(1, 2, ...)");
}

CaptureRequest ToCaptureRequest(const SnapBridgeScreenshotRequest& request) {
  CaptureRequest out;
  const std::string title = request.window_title ? request.window_title : "";
  const std::string process =
      request.process_name ? request.process_name : "";

  if (!title.empty()) {
    out.target.kind = TargetKind::kWindowByTitle;
    out.target.query = title;
  } else if (!process.empty()) {
    out.target.kind = TargetKind::kWindowByProcess;
    out.target.query = process;
  } else {
    out.target = ParseMonitorSpec(request.monitor ? request.monitor : "all");
  }
  if (out.target.is_window_query() && request.window_index != 0) {
    out.target.preferred_index = request.window_index;
  }

  out.output_mode =
      request.return_direct ? OutputMode::kDirect : OutputMode::kFile;
  out.quality = std::clamp(request.quality, 1, 100);
  if (request.filename) out.filename = request.filename;
  if (request.folder) out.folder = request.folder;
  return out;
}

// ---------------------------------------------------------------------------
// SnapBridgeContextImpl
// ---------------------------------------------------------------------------

SnapBridgeContextImpl::SnapBridgeContextImpl() : paths_(std::string(), "/") {}

SnapBridgeContextImpl::SnapBridgeContextImpl(
    Settings settings, std::unique_ptr<ProcessRunner> runner,
    PathTranslator paths)
    : settings_(std::move(settings)),
      runner_(std::move(runner)),
      paths_(std::move(paths)),
      formatter_(settings_.bridge_program, settings_.settle_delay_ms) {}

SnapBridgeContextImpl::~SnapBridgeContextImpl() = default;

bool SnapBridgeContextImpl::Initialize() {
  std::lock_guard<std::mutex> lock(mu_);
  if (runner_) return true;

  settings_ = Settings::LoadDefault();
  if (!settings_.log_level.empty()) {
    SetLogLevel(ParseLogLevel(settings_.log_level));
  }
  paths_ = PathTranslator::FromEnvironment(settings_.wsl_distro);
  formatter_ = CommandFormatter(settings_.bridge_program,
                                settings_.settle_delay_ms);

  runner_ = CreatePlatformProcessRunner();
  if (!runner_) {
    SetError(kSnapBridgeErrorUnknown, "Failed to create process runner");
    return false;
  }
  SNAPBRIDGE_LOG_DEBUG("snapbridge context initialized (bridge: {})",
                       settings_.bridge_program);
  ClearError();
  return true;
}

void SnapBridgeContextImpl::SetError(SnapBridgeError code,
                                     const std::string& message) {
  last_error_ = code;
  last_error_message_ = message;
  SNAPBRIDGE_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
}

void SnapBridgeContextImpl::ClearError() {
  last_error_ = kSnapBridgeOk;
  last_error_message_ = "No error";
}

std::unique_ptr<OperationResult> SnapBridgeContextImpl::TakeScreenshot(
    const SnapBridgeScreenshotRequest* request) {
  if (!request) {
    std::lock_guard<std::mutex> lock(mu_);
    SetError(kSnapBridgeErrorInvalidParam,
             std::string(kScreenshotFailure) + "request is NULL");
    return nullptr;
  }
  CaptureRequest converted;
  try {
    converted = ToCaptureRequest(*request);
  } catch (const BridgeError& e) {
    std::lock_guard<std::mutex> lock(mu_);
    SetError(e.code(), std::string(kScreenshotFailure) + e.what());
    return nullptr;
  }
  return TakeScreenshot(converted);
}

std::unique_ptr<OperationResult> SnapBridgeContextImpl::TakeScreenshot(
    const CaptureRequest& request) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!runner_) {
    SetError(kSnapBridgeErrorUnknown, "Context not initialized");
    return nullptr;
  }
  try {
    auto result =
        std::make_unique<OperationResult>(DoTakeScreenshot(request));
    ClearError();
    return result;
  } catch (const BridgeError& e) {
    SetError(e.code(), std::string(kScreenshotFailure) + e.what());
  } catch (const std::exception& e) {
    SetError(kSnapBridgeErrorUnknown,
             std::string(kScreenshotFailure) + e.what());
  }
  return nullptr;
}

std::unique_ptr<OperationResult> SnapBridgeContextImpl::ReadClipboard(
    ClipboardFormat format) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!runner_) {
    SetError(kSnapBridgeErrorUnknown, "Context not initialized");
    return nullptr;
  }
  try {
    auto result = std::make_unique<OperationResult>(DoReadClipboard(format));
    ClearError();
    return result;
  } catch (const BridgeError& e) {
    SetError(e.code(), std::string(kClipboardFailure) + e.what());
  } catch (const std::exception& e) {
    SetError(kSnapBridgeErrorUnknown,
             std::string(kClipboardFailure) + e.what());
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

ProcessOutput SnapBridgeContextImpl::RunBridge(const BridgeCommand& command) {
  RunLimits limits;
  limits.max_output_bytes = settings_.max_output_bytes;
  limits.timeout_ms = settings_.timeout_ms;

  ProcessOutput output = runner_->Run(command, limits);
  if (output.timed_out) {
    throw BridgeError(kSnapBridgeErrorBridgeTimeout,
                      "PowerShell bridge timed out after " +
                          std::to_string(limits.timeout_ms) + " ms");
  }
  if (output.output_truncated) {
    throw BridgeError(kSnapBridgeErrorBridgeFailure,
                      "bridge output exceeded " +
                          std::to_string(limits.max_output_bytes) + " bytes");
  }
  return output;
}

CaptureTarget SnapBridgeContextImpl::ResolveTarget(const TargetSpec& spec) {
  DesktopInventory inventory =
      ParseInventory(RunBridge(formatter_.Inventory(spec.is_window_query())));

  TargetResolver resolver(inventory);
  Resolution resolution = resolver.Resolve(spec);
  if (resolution.is_ambiguous()) {
    SNAPBRIDGE_LOG_INFO("{} windows match \"{}\"",
                        resolution.ambiguity.matches.size(), spec.query);
    throw BridgeError(kSnapBridgeErrorAmbiguousTarget,
                      FormatDisambiguation(resolution.ambiguity));
  }
  return resolution.target;
}

OperationResult SnapBridgeContextImpl::CompressImage(
    const std::vector<uint8_t>& png, int quality,
    const std::string& status_prefix) const {
  CompressedImage compressed = compressor_.CompressPng(png, quality);

  OperationResult out;
  out.width = compressed.width;
  out.height = compressed.height;
  out.quality = compressed.quality;
  out.resized = compressed.resized;
  long kb = std::lround(static_cast<double>(compressed.jpeg.size()) / 1024.0);
  out.text = status_prefix + " (" + std::to_string(kb) +
             "KB, JPEG quality: " + std::to_string(compressed.quality) + "%)";
  if (compressed.resized) {
    out.text += " - Resized to " + std::to_string(compressed.width) +
                "px width";
  }
  out.jpeg = std::move(compressed.jpeg);
  return out;
}

OperationResult SnapBridgeContextImpl::DoTakeScreenshot(
    const CaptureRequest& request) {
  // File-mode destination is settled before any bridge round-trip.
  std::string windows_destination;
  std::string local_file;
  std::string display_path;
  if (request.output_mode == OutputMode::kFile) {
    ValidateFilename(request.filename);
    const std::string folder =
        request.folder.empty() ? settings_.default_folder : request.folder;
    if (folder.empty()) {
      const std::string local_dir =
          PathTranslator::JoinPosix(paths_.cwd(), kDefaultFolderName);
      std::error_code ec;
      std::filesystem::create_directories(local_dir, ec);
      if (ec) {
        throw BridgeError(kSnapBridgeErrorFileNotCreated,
                          "Cannot create folder " + local_dir + ": " +
                              ec.message());
      }
      local_file = PathTranslator::JoinPosix(local_dir, request.filename);
      windows_destination = paths_.ToWindows(local_file);
      display_path = std::string(kDefaultFolderName) + "/" + request.filename;
    } else {
      windows_destination = PathTranslator::JoinWindows(
          paths_.ToWindows(folder), request.filename);
      local_file =
          PathTranslator::JoinPosix(paths_.ToLocal(folder), request.filename);
      display_path = windows_destination;
      std::replace(display_path.begin(), display_path.end(), '\\', '/');
    }
    SNAPBRIDGE_LOG_DEBUG("Saving capture to {} (local {})",
                         windows_destination, local_file);
  }

  CaptureTarget target = ResolveTarget(request.target);
  SNAPBRIDGE_LOG_INFO("Capturing {}x{} at ({}, {})", target.bounds.width,
                      target.bounds.height, target.bounds.x, target.bounds.y);

  ProcessOutput output = RunBridge(
      formatter_.Capture(target, request.output_mode, windows_destination));
  CaptureResult result = ParseCaptureOutput(output, request.output_mode);

  if (request.output_mode == OutputMode::kDirect) {
    if (result.kind != CaptureResult::Kind::kImage) ThrowForResult(result);
    return CompressImage(result.image_bytes, request.quality,
                         "Screenshot captured successfully");
  }

  if (result.kind != CaptureResult::Kind::kCompleted) ThrowForResult(result);
  std::error_code ec;
  if (!std::filesystem::exists(local_file, ec)) {
    throw BridgeError(kSnapBridgeErrorFileNotCreated,
                      "Screenshot file was not created: " + local_file);
  }
  OperationResult out;
  out.saved_path = display_path;
  out.text = "Screenshot saved successfully to: " + display_path;
  return out;
}

OperationResult SnapBridgeContextImpl::DoReadClipboard(ClipboardFormat format) {
  CaptureResult result =
      ParseClipboardOutput(RunBridge(formatter_.Clipboard(format)));

  OperationResult out;
  switch (result.kind) {
    case CaptureResult::Kind::kEmptyClipboard:
      out.text = "Clipboard is empty";
      return out;
    case CaptureResult::Kind::kNoTextInClipboard:
      out.text =
          "No text content in clipboard (clipboard may contain an image or "
          "other format)";
      return out;
    case CaptureResult::Kind::kNoImageInClipboard:
      out.text =
          "No image content in clipboard (clipboard may contain text or "
          "other format)";
      return out;
    case CaptureResult::Kind::kText:
      out.text = "Clipboard text content:\n\n" + result.text;
      return out;
    case CaptureResult::Kind::kImage:
      return CompressImage(result.image_bytes, kClipboardQuality,
                           "Clipboard image retrieved successfully");
    default:
      ThrowForResult(result);
  }
}

}  // namespace internal
}  // namespace snapbridge
