// Copyright 2026 The snapbridge Authors
//
// This file implements all public C API functions declared in snapbridge.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "snapbridge/snapbridge.h"

#include <memory>
#include <new>
#include <string>
#include <utility>

#include "core/base64.h"
#include "core/callback_sink.h"
#include "core/logger.h"
#include "core/snapbridge_context.h"

using snapbridge::internal::ClipboardFormat;
using snapbridge::internal::OperationResult;
using snapbridge::internal::SnapBridgeContextImpl;

// ---------------------------------------------------------------------------
// The opaque SnapBridgeContext struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct SnapBridgeContext {
  SnapBridgeContextImpl impl;
};

// ---------------------------------------------------------------------------
// The opaque SnapBridgeResult struct owns one operation outcome.
// ---------------------------------------------------------------------------
struct SnapBridgeResult {
  OperationResult impl;
  std::string base64;  // Encoded once, on creation.

  explicit SnapBridgeResult(OperationResult r) : impl(std::move(r)) {
    if (impl.has_image()) {
      base64 = snapbridge::internal::Base64Encode(impl.jpeg);
    }
  }
};

// Move an internal result into a heap-allocated SnapBridgeResult*.
static SnapBridgeResult* WrapResult(std::unique_ptr<OperationResult> raw) {
  if (!raw) return nullptr;
  return new (std::nothrow) SnapBridgeResult(std::move(*raw));
}

static ClipboardFormat ToInternal(SnapBridgeClipboardFormat format) {
  switch (format) {
    case kSnapBridgeClipboardText:  return ClipboardFormat::kText;
    case kSnapBridgeClipboardImage: return ClipboardFormat::kImage;
    default:                        return ClipboardFormat::kAuto;
  }
}

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

SnapBridgeContext* snapbridge_context_create(void) {
  auto* ctx = new (std::nothrow) SnapBridgeContext();
  if (!ctx) return nullptr;

  if (!ctx->impl.Initialize()) {
    delete ctx;
    return nullptr;
  }
  return ctx;
}

void snapbridge_context_destroy(SnapBridgeContext* ctx) {
  delete ctx;
}

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

SnapBridgeError snapbridge_get_last_error(const SnapBridgeContext* ctx) {
  if (!ctx) return kSnapBridgeErrorInvalidParam;
  return ctx->impl.last_error();
}

const char* snapbridge_get_last_error_message(const SnapBridgeContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl.last_error_message();
}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

void snapbridge_screenshot_request_init(SnapBridgeScreenshotRequest* request) {
  if (!request) return;
  request->filename = "screenshot.png";
  request->monitor = "all";
  request->window_title = nullptr;
  request->process_name = nullptr;
  request->window_index = 0;
  request->folder = nullptr;
  request->return_direct = 1;
  request->quality = 80;
}

SnapBridgeResult* snapbridge_take_screenshot(
    SnapBridgeContext* ctx, const SnapBridgeScreenshotRequest* request) {
  if (!ctx) return nullptr;
  return WrapResult(ctx->impl.TakeScreenshot(request));
}

SnapBridgeResult* snapbridge_read_clipboard(SnapBridgeContext* ctx,
                                            SnapBridgeClipboardFormat format) {
  if (!ctx) return nullptr;
  return WrapResult(ctx->impl.ReadClipboard(ToInternal(format)));
}

// ---------------------------------------------------------------------------
// Result accessors
// ---------------------------------------------------------------------------

void snapbridge_result_destroy(SnapBridgeResult* result) {
  delete result;
}

const char* snapbridge_result_get_text(const SnapBridgeResult* result) {
  if (!result) return "";
  return result->impl.text.c_str();
}

int snapbridge_result_has_image(const SnapBridgeResult* result) {
  return (result && result->impl.has_image()) ? 1 : 0;
}

const uint8_t* snapbridge_result_get_image_data(
    const SnapBridgeResult* result) {
  if (!result || !result->impl.has_image()) return nullptr;
  return result->impl.jpeg.data();
}

size_t snapbridge_result_get_image_size(const SnapBridgeResult* result) {
  if (!result) return 0;
  return result->impl.jpeg.size();
}

const char* snapbridge_result_get_image_base64(
    const SnapBridgeResult* result) {
  if (!result) return "";
  return result->base64.c_str();
}

const char* snapbridge_result_get_mime_type(const SnapBridgeResult* result) {
  return (result && result->impl.has_image()) ? "image/jpeg" : "";
}

int snapbridge_result_get_width(const SnapBridgeResult* result) {
  return result ? result->impl.width : 0;
}

int snapbridge_result_get_height(const SnapBridgeResult* result) {
  return result ? result->impl.height : 0;
}

int snapbridge_result_get_quality(const SnapBridgeResult* result) {
  return result ? result->impl.quality : 0;
}

int snapbridge_result_was_resized(const SnapBridgeResult* result) {
  return (result && result->impl.resized) ? 1 : 0;
}

const char* snapbridge_result_get_saved_path(const SnapBridgeResult* result) {
  if (!result) return "";
  return result->impl.saved_path.c_str();
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* snapbridge_version_string(void) {
  return SNAPBRIDGE_VERSION_STRING;
}

int snapbridge_version_major(void) { return SNAPBRIDGE_VERSION_MAJOR; }
int snapbridge_version_minor(void) { return SNAPBRIDGE_VERSION_MINOR; }
int snapbridge_version_patch(void) { return SNAPBRIDGE_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void snapbridge_set_log_level(SnapBridgeLogLevel level) {
  snapbridge::internal::SetLogLevel(level);
}

void snapbridge_set_log_callback(snapbridge_log_callback_t callback,
                                 void* userdata) {
  auto sink = snapbridge::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void snapbridge_log(SnapBridgeLogLevel level, const char* message) {
  if (!message) return;
  auto logger = snapbridge::internal::GetLogger();
  if (logger) {
    logger->log(snapbridge::internal::ToSpdlogLevel(level), "{}", message);
  }
}
