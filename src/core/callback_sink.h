// Copyright 2026 The snapbridge Authors
//
// spdlog sink forwarding each formatted record to the embedder's
// snapbridge_log_callback_t, one line per call without the trailing EOL.

#ifndef SNAPBRIDGE_CORE_CALLBACK_SINK_H_
#define SNAPBRIDGE_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "core/logger.h"
#include "snapbridge/snapbridge.h"

namespace snapbridge {
namespace internal {

class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
  using Base = spdlog::sinks::base_sink<std::mutex>;

 public:
  /// nullptr disables forwarding.  Guarded by the sink mutex.
  void SetCallback(snapbridge_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(Base::mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;

    spdlog::memory_buf_t formatted;
    Base::formatter_->format(msg, formatted);
    std::string line(formatted.data(), formatted.size());
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
      line.pop_back();
    }
    callback_(FromSpdlogLevel(msg.level), line.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  snapbridge_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CORE_CALLBACK_SINK_H_
