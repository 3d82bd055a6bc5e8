// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_CORE_LOGGER_H_
#define BOARDKIT_CORE_LOGGER_H_

#include <memory>
#include <optional>
#include <string>

#include "spdlog/spdlog.h"

#include "boardkit/boardkit.h"

namespace boardkit {
namespace internal {

class CallbackSink;

/// Create the process-wide "boardkit" logger (stderr + callback sink).
/// Safe to call repeatedly; only the first call does any work.
void InitLogger();

/// The shared boardkit logger.
std::shared_ptr<spdlog::logger> GetLogger();

/// Sink that forwards to the host callback registered through the C API.
std::shared_ptr<CallbackSink> GetCallbackSink();

void SetLogLevel(BoardKitLogLevel level);
BoardKitLogLevel GetLogLevel();

spdlog::level::level_enum ToSpdlogLevel(BoardKitLogLevel level);
BoardKitLogLevel FromSpdlogLevel(spdlog::level::level_enum level);

/// Parse a level name as written in settings files ("trace", "debug",
/// "info", "warn", "error", "fatal"; case-insensitive).
std::optional<BoardKitLogLevel> ParseLogLevel(const std::string& name);
const char* LogLevelName(BoardKitLogLevel level);

}  // namespace internal
}  // namespace boardkit

// ---------------------------------------------------------------------------
// Convenience macros (internal use only).
// ---------------------------------------------------------------------------

#define BOARDKIT_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::boardkit::internal::GetLogger(), __VA_ARGS__)
#define BOARDKIT_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::boardkit::internal::GetLogger(), __VA_ARGS__)
#define BOARDKIT_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::boardkit::internal::GetLogger(), __VA_ARGS__)
#define BOARDKIT_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::boardkit::internal::GetLogger(), __VA_ARGS__)
#define BOARDKIT_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::boardkit::internal::GetLogger(), __VA_ARGS__)
#define BOARDKIT_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::boardkit::internal::GetLogger(), __VA_ARGS__)

#endif  // BOARDKIT_CORE_LOGGER_H_
