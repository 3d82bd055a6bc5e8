// Copyright 2026 The boardkit Authors
// Undo/redo log of reversible board actions.

#ifndef BOARDKIT_HISTORY_HISTORY_MANAGER_H_
#define BOARDKIT_HISTORY_HISTORY_MANAGER_H_

#include <deque>
#include <vector>

#include "history/history_action.h"
#include "scene/scene_model.h"

namespace boardkit {
namespace internal {

struct HistoryStats {
  int undo_count = 0;
  int redo_count = 0;
  int max_history = 0;
};

/// Linear undo/redo history over a SceneModel.
///
/// Pushing clears the redo stack. Undo and redo move actions between the
/// stacks and never record anything themselves; a Push() issued while an
/// action is being applied is ignored.
class HistoryManager {
 public:
  static constexpr int kDefaultMaxHistory = 50;

  /// Does NOT take ownership of scene.
  explicit HistoryManager(SceneModel* scene);

  // Non-copyable.
  HistoryManager(const HistoryManager&) = delete;
  HistoryManager& operator=(const HistoryManager&) = delete;

  /// Stamp and record an already-applied action. Malformed actions are
  /// logged and discarded. Returns true if the action was recorded.
  bool Push(Action action);

  /// Revert the most recent action. False if nothing to undo or the action
  /// was malformed (it is then dropped).
  bool Undo();

  /// Re-apply the most recently undone action.
  bool Redo();

  bool CanUndo() const { return !undo_stack_.empty(); }
  bool CanRedo() const { return !redo_stack_.empty(); }
  bool is_applying() const { return applying_; }

  void Clear();

  /// Bound the undo stack (minimum 1), dropping the oldest excess entries.
  void SetMaxHistory(int max_history);
  int max_history() const { return max_history_; }

  HistoryStats Stats() const;

  /// Oldest first.
  const std::deque<Action>& undo_stack() const { return undo_stack_; }
  const std::deque<Action>& redo_stack() const { return redo_stack_; }

  /// Ids touched by the action most recently undone or redone.
  const std::vector<std::string>& last_affected_ids() const {
    return last_affected_ids_;
  }

 private:
  void PurgeExcess();

  SceneModel* scene_;  // Non-owning
  std::deque<Action> undo_stack_;
  std::deque<Action> redo_stack_;
  int max_history_ = kDefaultMaxHistory;
  bool applying_ = false;
  std::vector<std::string> last_affected_ids_;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_HISTORY_HISTORY_MANAGER_H_
