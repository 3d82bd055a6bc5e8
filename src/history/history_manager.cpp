// Copyright 2026 The boardkit Authors
// Undo/redo log implementation.

#include "history/history_manager.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "core/logger.h"

namespace boardkit {
namespace internal {

namespace {

int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// Clears the applying flag on scope exit.
class ApplyingScope {
 public:
  explicit ApplyingScope(bool* flag) : flag_(flag) { *flag_ = true; }
  ~ApplyingScope() { *flag_ = false; }

 private:
  bool* flag_;
};

}  // namespace

HistoryManager::HistoryManager(SceneModel* scene) : scene_(scene) {}

bool HistoryManager::Push(Action action) {
  if (applying_) {
    BOARDKIT_LOG_DEBUG("Ignoring {} pushed during undo/redo",
                       ActionTypeName(action.type));
    return false;
  }
  try {
    ValidateAction(action);
  } catch (const std::invalid_argument& e) {
    BOARDKIT_LOG_ERROR("Discarding malformed history action: {}", e.what());
    return false;
  }

  action.timestamp = NowMillis();
  BOARDKIT_LOG_DEBUG("History push {}", ActionTypeName(action.type));
  undo_stack_.push_back(std::move(action));
  redo_stack_.clear();
  PurgeExcess();
  return true;
}

bool HistoryManager::Undo() {
  if (undo_stack_.empty()) return false;

  Action action = std::move(undo_stack_.back());
  undo_stack_.pop_back();

  try {
    ApplyingScope scope(&applying_);
    ApplyInverse(action, scene_);
  } catch (const std::invalid_argument& e) {
    BOARDKIT_LOG_ERROR("Dropping malformed {} on undo: {}",
                       ActionTypeName(action.type), e.what());
    return false;
  }

  BOARDKIT_LOG_DEBUG("Undo {}", ActionTypeName(action.type));
  last_affected_ids_ = AffectedIds(action);
  redo_stack_.push_back(std::move(action));
  scene_->RequestRedraw();
  return true;
}

bool HistoryManager::Redo() {
  if (redo_stack_.empty()) return false;

  Action action = std::move(redo_stack_.back());
  redo_stack_.pop_back();

  try {
    ApplyingScope scope(&applying_);
    ApplyForward(action, scene_);
  } catch (const std::invalid_argument& e) {
    BOARDKIT_LOG_ERROR("Dropping malformed {} on redo: {}",
                       ActionTypeName(action.type), e.what());
    return false;
  }

  BOARDKIT_LOG_DEBUG("Redo {}", ActionTypeName(action.type));
  last_affected_ids_ = AffectedIds(action);
  undo_stack_.push_back(std::move(action));
  PurgeExcess();
  scene_->RequestRedraw();
  return true;
}

void HistoryManager::Clear() {
  undo_stack_.clear();
  redo_stack_.clear();
  last_affected_ids_.clear();
}

void HistoryManager::SetMaxHistory(int max_history) {
  max_history_ = (std::max)(1, max_history);
  PurgeExcess();
}

HistoryStats HistoryManager::Stats() const {
  HistoryStats stats;
  stats.undo_count = static_cast<int>(undo_stack_.size());
  stats.redo_count = static_cast<int>(redo_stack_.size());
  stats.max_history = max_history_;
  return stats;
}

void HistoryManager::PurgeExcess() {
  while (static_cast<int>(undo_stack_.size()) > max_history_) {
    undo_stack_.pop_front();
  }
}

}  // namespace internal
}  // namespace boardkit
