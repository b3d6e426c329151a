// Copyright 2026 The snapbridge Authors

#ifndef SNAPBRIDGE_CORE_SNAPBRIDGE_CONTEXT_H_
#define SNAPBRIDGE_CORE_SNAPBRIDGE_CONTEXT_H_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "bridge/command_formatter.h"
#include "bridge/process_runner.h"
#include "capture/capture_types.h"
#include "capture/image_compressor.h"
#include "core/settings.h"
#include "path/path_translator.h"
#include "snapbridge/snapbridge.h"

namespace snapbridge {
namespace internal {

/// Successful outcome of a screenshot or clipboard request.
struct OperationResult {
  std::string text;           ///< Status line shown to the caller
  std::vector<uint8_t> jpeg;  ///< Empty when there is no image
  int width = 0;
  int height = 0;
  int quality = 0;
  bool resized = false;
  std::string saved_path;     ///< File mode only (display form)

  bool has_image() const { return !jpeg.empty(); }
};

/// Convert a public request into a CaptureRequest.  Throws
/// BridgeError(kSnapBridgeErrorInvalidParam) on malformed input.
CaptureRequest ToCaptureRequest(const SnapBridgeScreenshotRequest& request);

/// Parse "all", "primary" or a 1-based monitor number (case-insensitive).
TargetSpec ParseMonitorSpec(const std::string& monitor);

/// Internal implementation of the opaque SnapBridgeContext handle.
///
/// Owns the settings and the process runner and provides the bridge between
/// the public C API and the capture pipeline.  Calls are serialized.
class SnapBridgeContextImpl {
 public:
  SnapBridgeContextImpl();

  /// Construct with explicit collaborators (tests inject a fake runner).
  SnapBridgeContextImpl(Settings settings,
                        std::unique_ptr<ProcessRunner> runner,
                        PathTranslator paths);
  ~SnapBridgeContextImpl();

  // Non-copyable.
  SnapBridgeContextImpl(const SnapBridgeContextImpl&) = delete;
  SnapBridgeContextImpl& operator=(const SnapBridgeContextImpl&) = delete;

  /// Load settings from the per-user file and create the platform runner.
  bool Initialize();

  bool is_initialized() const { return runner_ != nullptr; }

  // -- Error state --

  SnapBridgeError last_error() const { return last_error_; }
  const char* last_error_message() const { return last_error_message_.c_str(); }

  void SetError(SnapBridgeError code, const std::string& message);
  void ClearError();

  // -- Operations --

  /// Returns nullptr on failure (see last_error()).  A NULL `request` is
  /// kSnapBridgeErrorInvalidParam.
  std::unique_ptr<OperationResult> TakeScreenshot(
      const SnapBridgeScreenshotRequest* request);
  std::unique_ptr<OperationResult> TakeScreenshot(
      const CaptureRequest& request);
  std::unique_ptr<OperationResult> ReadClipboard(ClipboardFormat format);

  const Settings& settings() const { return settings_; }

 private:
  OperationResult DoTakeScreenshot(const CaptureRequest& request);
  OperationResult DoReadClipboard(ClipboardFormat format);

  /// Run one bridge command; timeouts and output overflow throw.
  ProcessOutput RunBridge(const BridgeCommand& command);

  /// Inventory round-trip plus resolution.  Ambiguity throws.
  CaptureTarget ResolveTarget(const TargetSpec& spec);

  /// Compress PNG bytes into a JPEG result with a status line starting with
  /// `status_prefix`.
  OperationResult CompressImage(const std::vector<uint8_t>& png, int quality,
                                const std::string& status_prefix) const;

  Settings settings_;
  std::unique_ptr<ProcessRunner> runner_;
  PathTranslator paths_;
  CommandFormatter formatter_;
  ImageCompressor compressor_;
  std::mutex mu_;

  // Error state (per-context, so thread-safe across contexts).
  SnapBridgeError last_error_ = kSnapBridgeOk;
  std::string last_error_message_ = "No error";
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CORE_SNAPBRIDGE_CONTEXT_H_
