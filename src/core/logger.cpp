// Copyright 2026 The boardkit Authors

#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace boardkit {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

struct LevelName {
  BoardKitLogLevel level;
  const char* name;
};

constexpr LevelName kLevelNames[] = {
    {kBoardKitLogTrace, "trace"}, {kBoardKitLogDebug, "debug"},
    {kBoardKitLogInfo, "info"},   {kBoardKitLogWarn, "warn"},
    {kBoardKitLogError, "error"}, {kBoardKitLogFatal, "fatal"},
};

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_callback_sink = std::make_shared<CallbackSink>();

    spdlog::sinks_init_list sinks = {stderr_sink, g_callback_sink};
    g_logger = std::make_shared<spdlog::logger>("boardkit", sinks);

    // [boardkit][level] message
    g_logger->set_pattern("[boardkit][%l] %v");
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

void SetLogLevel(BoardKitLogLevel level) {
  GetLogger()->set_level(ToSpdlogLevel(level));
}

BoardKitLogLevel GetLogLevel() {
  return FromSpdlogLevel(GetLogger()->level());
}

spdlog::level::level_enum ToSpdlogLevel(BoardKitLogLevel level) {
  switch (level) {
    case kBoardKitLogTrace: return spdlog::level::trace;
    case kBoardKitLogDebug: return spdlog::level::debug;
    case kBoardKitLogInfo:  return spdlog::level::info;
    case kBoardKitLogWarn:  return spdlog::level::warn;
    case kBoardKitLogError: return spdlog::level::err;
    case kBoardKitLogFatal: return spdlog::level::critical;
    default:                return spdlog::level::info;
  }
}

BoardKitLogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace:    return kBoardKitLogTrace;
    case spdlog::level::debug:    return kBoardKitLogDebug;
    case spdlog::level::info:     return kBoardKitLogInfo;
    case spdlog::level::warn:     return kBoardKitLogWarn;
    case spdlog::level::err:      return kBoardKitLogError;
    case spdlog::level::critical: return kBoardKitLogFatal;
    case spdlog::level::off:      return kBoardKitLogFatal;
    default:                      return kBoardKitLogInfo;
  }
}

std::optional<BoardKitLogLevel> ParseLogLevel(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  for (const auto& entry : kLevelNames) {
    if (lower == entry.name) return entry.level;
  }
  if (lower == "warning") return kBoardKitLogWarn;
  if (lower == "critical") return kBoardKitLogFatal;
  return std::nullopt;
}

const char* LogLevelName(BoardKitLogLevel level) {
  for (const auto& entry : kLevelNames) {
    if (entry.level == level) return entry.name;
  }
  return "info";
}

}  // namespace internal
}  // namespace boardkit
