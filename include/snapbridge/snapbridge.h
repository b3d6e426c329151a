// Copyright 2026 The snapbridge Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef SNAPBRIDGE_SNAPBRIDGE_H_
#define SNAPBRIDGE_SNAPBRIDGE_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32)
#if defined(SNAPBRIDGE_BUILDING)
#define SNAPBRIDGE_API __declspec(dllexport)
#else
#define SNAPBRIDGE_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define SNAPBRIDGE_API __attribute__((visibility("default")))
#else
#define SNAPBRIDGE_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "snapbridge/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
//   - Each SnapBridgeContext is independent; different contexts may be used
//     concurrently from different threads.
//   - Calls on the SAME context are serialized internally.  A screenshot
//     request blocks until the bridge process exits or times out.
//   - SnapBridgeResult objects are immutable after creation.
//   - snapbridge_set_log_level() and snapbridge_set_log_callback() are
//     process-global and internally synchronized.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct SnapBridgeContext SnapBridgeContext;
typedef struct SnapBridgeResult SnapBridgeResult;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by snapbridge functions.
typedef enum SnapBridgeError {
  kSnapBridgeOk = 0,
  kSnapBridgeErrorInvalidParam = -1,
  kSnapBridgeErrorWindowNotFound = -2,
  kSnapBridgeErrorProcessNotFound = -3,
  kSnapBridgeErrorAmbiguousTarget = -4,    ///< Several windows matched
  kSnapBridgeErrorInvalidMonitorIndex = -5,
  kSnapBridgeErrorMonitorNotFound = -6,    ///< No primary monitor reported
  kSnapBridgeErrorInvalidRegion = -7,      ///< Target has no visible area
  kSnapBridgeErrorBridgeFailure = -8,      ///< Bridge failed without a marker
  kSnapBridgeErrorBridgeTimeout = -9,
  kSnapBridgeErrorOutputParse = -10,       ///< Expected marker missing
  kSnapBridgeErrorImageDecode = -11,
  kSnapBridgeErrorImageEncode = -12,
  kSnapBridgeErrorFileNotCreated = -13,
  kSnapBridgeErrorUnknown = -99,
} SnapBridgeError;

/// Clipboard read format.
typedef enum SnapBridgeClipboardFormat {
  kSnapBridgeClipboardAuto = 0,   ///< Prefer image, then text
  kSnapBridgeClipboardText = 1,
  kSnapBridgeClipboardImage = 2,
} SnapBridgeClipboardFormat;

/// Log severity levels for the internal logging system.
typedef enum SnapBridgeLogLevel {
  kSnapBridgeLogTrace = 0,
  kSnapBridgeLogDebug = 1,
  kSnapBridgeLogInfo = 2,    ///< Default
  kSnapBridgeLogWarn = 3,
  kSnapBridgeLogError = 4,
  kSnapBridgeLogFatal = 5,
} SnapBridgeLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to snapbridge_set_log_callback.
typedef void (*snapbridge_log_callback_t)(SnapBridgeLogLevel level,
                                          const char* message,
                                          void* userdata);

/// Screenshot request.  Initialize with snapbridge_screenshot_request_init()
/// before filling in fields; NULL strings select the defaults.
typedef struct SnapBridgeScreenshotRequest {
  const char* filename;      ///< File name in File mode ("screenshot.png")
  const char* monitor;       ///< "all" (default), "primary" or "1", "2", ...
  const char* window_title;  ///< Partial, case-insensitive window title
  const char* process_name;  ///< Owning process, ".exe" optional
  int window_index;          ///< 1-based choice among matches, 0 = not given
  const char* folder;        ///< Destination folder (WSL or Windows path)
  int return_direct;         ///< Non-zero: return JPEG bytes, write no file
  int quality;               ///< JPEG quality 1-100 (default 80)
} SnapBridgeScreenshotRequest;

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create a new context.  Settings are read from
/// $XDG_CONFIG_HOME/snapbridge/settings.ini when present.
///
/// @return A new context, or NULL on failure.
SNAPBRIDGE_API SnapBridgeContext* snapbridge_context_create(void);

/// Destroy a context.  NULL is safely ignored.
SNAPBRIDGE_API void snapbridge_context_destroy(SnapBridgeContext* ctx);

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

/// Get the error code from the last failed operation on this context.
SNAPBRIDGE_API SnapBridgeError snapbridge_get_last_error(
    const SnapBridgeContext* ctx);

/// Get a human-readable error message for the last failed operation.
/// For ambiguous window queries this is the numbered list of candidates
/// with retry instructions.
///
/// Lifetime: valid until the next API call on the same context.
///
/// @return UTF-8 error message. Never returns NULL.
SNAPBRIDGE_API const char* snapbridge_get_last_error_message(
    const SnapBridgeContext* ctx);

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

/// Fill a request with defaults (monitor "all", direct return, quality 80).
SNAPBRIDGE_API void snapbridge_screenshot_request_init(
    SnapBridgeScreenshotRequest* request);

/// Capture a monitor, the whole desktop, or a window.
/// Caller must free the result with snapbridge_result_destroy().
///
/// @return A result, or NULL on failure (see snapbridge_get_last_error()).
SNAPBRIDGE_API SnapBridgeResult* snapbridge_take_screenshot(
    SnapBridgeContext* ctx, const SnapBridgeScreenshotRequest* request);

/// Read the Windows clipboard.  An empty clipboard, or one without the
/// requested format, is a successful result with an explanatory status.
SNAPBRIDGE_API SnapBridgeResult* snapbridge_read_clipboard(
    SnapBridgeContext* ctx, SnapBridgeClipboardFormat format);

// ---------------------------------------------------------------------------
// Result accessors
// ---------------------------------------------------------------------------

/// Destroy a result.  NULL is safely ignored.
SNAPBRIDGE_API void snapbridge_result_destroy(SnapBridgeResult* result);

/// Status line describing the outcome (UTF-8, never NULL).
SNAPBRIDGE_API const char* snapbridge_result_get_text(
    const SnapBridgeResult* result);

/// Non-zero when the result carries a JPEG image.
SNAPBRIDGE_API int snapbridge_result_has_image(const SnapBridgeResult* result);

/// JPEG bytes (NULL when there is no image).
SNAPBRIDGE_API const uint8_t* snapbridge_result_get_image_data(
    const SnapBridgeResult* result);
SNAPBRIDGE_API size_t snapbridge_result_get_image_size(
    const SnapBridgeResult* result);

/// Base64 of the JPEG bytes ("" when there is no image).
SNAPBRIDGE_API const char* snapbridge_result_get_image_base64(
    const SnapBridgeResult* result);

SNAPBRIDGE_API const char* snapbridge_result_get_mime_type(
    const SnapBridgeResult* result);
SNAPBRIDGE_API int snapbridge_result_get_width(const SnapBridgeResult* result);
SNAPBRIDGE_API int snapbridge_result_get_height(const SnapBridgeResult* result);
SNAPBRIDGE_API int snapbridge_result_get_quality(
    const SnapBridgeResult* result);
SNAPBRIDGE_API int snapbridge_result_was_resized(
    const SnapBridgeResult* result);

/// Saved file path in File mode ("" otherwise).
SNAPBRIDGE_API const char* snapbridge_result_get_saved_path(
    const SnapBridgeResult* result);

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

/// Get the library version as a string (e.g. "1.0.0").
SNAPBRIDGE_API const char* snapbridge_version_string(void);
SNAPBRIDGE_API int snapbridge_version_major(void);
SNAPBRIDGE_API int snapbridge_version_minor(void);
SNAPBRIDGE_API int snapbridge_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the global log level.  Messages below this level are discarded.
SNAPBRIDGE_API void snapbridge_set_log_level(SnapBridgeLogLevel level);

/// Register a callback that receives every log message.  Pass NULL to
/// unregister.
SNAPBRIDGE_API void snapbridge_set_log_callback(
    snapbridge_log_callback_t callback, void* userdata);

/// Emit a message through the snapbridge logger.  NULL is ignored.
SNAPBRIDGE_API void snapbridge_log(SnapBridgeLogLevel level,
                                   const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // SNAPBRIDGE_SNAPBRIDGE_H_
