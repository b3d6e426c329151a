// Copyright 2026 The snapbridge Authors

#include "core/logger.h"

#include <cctype>
#include <mutex>
#include <string>

#include "spdlog/sinks/stdout_color_sinks.h"

#include "core/callback_sink.h"

namespace snapbridge {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_callback_sink = std::make_shared<CallbackSink>();

    g_logger = std::make_shared<spdlog::logger>(
        "snapbridge", spdlog::sinks_init_list{stderr_sink, g_callback_sink});
    g_logger->set_pattern("[snapbridge][%l] %v");
    g_logger->set_level(spdlog::level::info);
    g_logger->flush_on(spdlog::level::warn);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return g_logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return g_callback_sink;
}

void SetLogLevel(SnapBridgeLogLevel level) {
  GetLogger()->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum ToSpdlogLevel(SnapBridgeLogLevel level) {
  switch (level) {
    case kSnapBridgeLogTrace: return spdlog::level::trace;
    case kSnapBridgeLogDebug: return spdlog::level::debug;
    case kSnapBridgeLogWarn:  return spdlog::level::warn;
    case kSnapBridgeLogError: return spdlog::level::err;
    case kSnapBridgeLogFatal: return spdlog::level::critical;
    default:                  return spdlog::level::info;
  }
}

SnapBridgeLogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace:    return kSnapBridgeLogTrace;
    case spdlog::level::debug:    return kSnapBridgeLogDebug;
    case spdlog::level::warn:     return kSnapBridgeLogWarn;
    case spdlog::level::err:      return kSnapBridgeLogError;
    case spdlog::level::critical:
    case spdlog::level::off:      return kSnapBridgeLogFatal;
    default:                      return kSnapBridgeLogInfo;
  }
}

SnapBridgeLogLevel ParseLogLevel(const std::string& name) {
  std::string lower;
  for (char c : name) {
    lower.push_back(static_cast<char>(
        std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "trace") return kSnapBridgeLogTrace;
  if (lower == "debug") return kSnapBridgeLogDebug;
  if (lower == "warn" || lower == "warning") return kSnapBridgeLogWarn;
  if (lower == "error") return kSnapBridgeLogError;
  if (lower == "fatal" || lower == "critical") return kSnapBridgeLogFatal;
  return kSnapBridgeLogInfo;
}

}  // namespace internal
}  // namespace snapbridge
