// Copyright 2026 The snapbridge Authors
//
// C++ RAII wrapper for the snapbridge C API.
// Header-only; include this file.  Requires C++17 or later.
//
// Usage:
//   #include "snapbridge/snapbridge.hpp"
//   snapbridge::Context ctx;
//   snapbridge::ScreenshotOptions opts;
//   opts.window_title = "Notepad";
//   auto shot = ctx.TakeScreenshot(opts);
//   printf("%s (%zu bytes)\n", shot.text(), shot.image_size());

#ifndef SNAPBRIDGE_SNAPBRIDGE_HPP_
#define SNAPBRIDGE_SNAPBRIDGE_HPP_

#include "snapbridge/snapbridge.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace snapbridge {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(SnapBridgeError code, const char* msg)
      : std::runtime_error(msg ? msg : "snapbridge error"), code_(code) {}
  SnapBridgeError code() const noexcept { return code_; }

 private:
  SnapBridgeError code_;
};

// ---------------------------------------------------------------------------
// Screenshot options
// ---------------------------------------------------------------------------

struct ScreenshotOptions {
  std::string monitor = "all";
  std::string window_title;
  std::string process_name;
  std::optional<int> window_index;
  std::string filename = "screenshot.png";
  std::string folder;
  bool return_direct = true;
  int quality = 80;
};

// ---------------------------------------------------------------------------
// Result  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Result {
 public:
  Result() noexcept = default;
  explicit Result(SnapBridgeResult* raw) noexcept : raw_(raw) {}
  ~Result() { snapbridge_result_destroy(raw_); }

  Result(Result&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Result& operator=(Result&& o) noexcept {
    if (this != &o) {
      snapbridge_result_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Result(const Result&) = delete;
  Result& operator=(const Result&) = delete;

  explicit operator bool() const noexcept { return raw_ != nullptr; }
  SnapBridgeResult* get() const noexcept { return raw_; }

  const char* text() const { return snapbridge_result_get_text(raw_); }
  bool has_image() const { return snapbridge_result_has_image(raw_) != 0; }
  const uint8_t* image_data() const {
    return snapbridge_result_get_image_data(raw_);
  }
  size_t image_size() const { return snapbridge_result_get_image_size(raw_); }
  std::vector<uint8_t> image_bytes() const {
    const uint8_t* p = image_data();
    return p ? std::vector<uint8_t>(p, p + image_size())
             : std::vector<uint8_t>();
  }
  const char* image_base64() const {
    return snapbridge_result_get_image_base64(raw_);
  }
  const char* mime_type() const { return snapbridge_result_get_mime_type(raw_); }
  int width() const { return snapbridge_result_get_width(raw_); }
  int height() const { return snapbridge_result_get_height(raw_); }
  int quality() const { return snapbridge_result_get_quality(raw_); }
  bool resized() const { return snapbridge_result_was_resized(raw_) != 0; }
  const char* saved_path() const {
    return snapbridge_result_get_saved_path(raw_);
  }

 private:
  SnapBridgeResult* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(snapbridge_context_create()) {
    if (!raw_) throw Error(kSnapBridgeErrorUnknown, "Context creation failed");
  }
  ~Context() { snapbridge_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      snapbridge_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  SnapBridgeContext* get() const noexcept { return raw_; }

  SnapBridgeError last_error() const { return snapbridge_get_last_error(raw_); }
  const char* last_error_message() const {
    return snapbridge_get_last_error_message(raw_);
  }

  Result TakeScreenshot(const ScreenshotOptions& opts) {
    SnapBridgeScreenshotRequest req;
    snapbridge_screenshot_request_init(&req);
    req.monitor = opts.monitor.c_str();
    req.window_title = opts.window_title.empty() ? nullptr
                                                 : opts.window_title.c_str();
    req.process_name = opts.process_name.empty() ? nullptr
                                                 : opts.process_name.c_str();
    req.window_index = opts.window_index.value_or(0);
    req.filename = opts.filename.c_str();
    req.folder = opts.folder.empty() ? nullptr : opts.folder.c_str();
    req.return_direct = opts.return_direct ? 1 : 0;
    req.quality = opts.quality;

    auto* res = snapbridge_take_screenshot(raw_, &req);
    if (!res) throw_last("TakeScreenshot failed");
    return Result(res);
  }

  Result ReadClipboard(
      SnapBridgeClipboardFormat format = kSnapBridgeClipboardAuto) {
    auto* res = snapbridge_read_clipboard(raw_, format);
    if (!res) throw_last("ReadClipboard failed");
    return Result(res);
  }

 private:
  [[noreturn]] void throw_last(const char* fallback) {
    auto err = snapbridge_get_last_error(raw_);
    const char* msg = snapbridge_get_last_error_message(raw_);
    throw Error(err != kSnapBridgeOk ? err : kSnapBridgeErrorUnknown,
                (msg && msg[0]) ? msg : fallback);
  }

  SnapBridgeContext* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

inline void set_log_level(SnapBridgeLogLevel level) {
  snapbridge_set_log_level(level);
}

inline const char* version_string() { return snapbridge_version_string(); }

}  // namespace snapbridge

#endif  // SNAPBRIDGE_SNAPBRIDGE_HPP_
