// Copyright 2026 The snapbridge Authors
//
// Process-wide spdlog logger.  Records go to stderr and, when registered,
// to the embedder's callback; never to stdout, which carries CLI payloads.

#ifndef SNAPBRIDGE_CORE_LOGGER_H_
#define SNAPBRIDGE_CORE_LOGGER_H_

#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "snapbridge/snapbridge.h"

namespace snapbridge {
namespace internal {

class CallbackSink;

/// Lazily create the "snapbridge" logger.  Idempotent and thread-safe.
void InitLogger();

std::shared_ptr<spdlog::logger> GetLogger();
std::shared_ptr<CallbackSink> GetCallbackSink();

void SetLogLevel(SnapBridgeLogLevel level);

spdlog::level::level_enum ToSpdlogLevel(SnapBridgeLogLevel level);
SnapBridgeLogLevel FromSpdlogLevel(spdlog::level::level_enum level);

/// Level named by the settings file's log_level key, case-insensitive
/// ("trace", "debug", "info", "warn", "error", "fatal").  Unknown names
/// map to info.
SnapBridgeLogLevel ParseLogLevel(const std::string& name);

}  // namespace internal
}  // namespace snapbridge

// Compiled in down to trace (SPDLOG_ACTIVE_LEVEL); filtered at runtime.
#define SNAPBRIDGE_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::snapbridge::internal::GetLogger(), __VA_ARGS__)
#define SNAPBRIDGE_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::snapbridge::internal::GetLogger(), __VA_ARGS__)
#define SNAPBRIDGE_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::snapbridge::internal::GetLogger(), __VA_ARGS__)
#define SNAPBRIDGE_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::snapbridge::internal::GetLogger(), __VA_ARGS__)
#define SNAPBRIDGE_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::snapbridge::internal::GetLogger(), __VA_ARGS__)
#define SNAPBRIDGE_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::snapbridge::internal::GetLogger(), __VA_ARGS__)

#endif  // SNAPBRIDGE_CORE_LOGGER_H_
