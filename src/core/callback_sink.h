// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_CORE_CALLBACK_SINK_H_
#define BOARDKIT_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "boardkit/boardkit.h"
#include "core/logger.h"

namespace boardkit {
namespace internal {

/// spdlog sink that hands each formatted record to the host's
/// boardkit_log_callback_t. Guarded by the base_sink mutex.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  CallbackSink() = default;

  /// nullptr disables forwarding.
  void SetCallback(boardkit_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;

    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);
    std::string text(formatted.data(), formatted.size());
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
      text.pop_back();
    }

    callback_(FromSpdlogLevel(msg.level), text.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  boardkit_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_CORE_CALLBACK_SINK_H_
