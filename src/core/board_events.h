// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_CORE_BOARD_EVENTS_H_
#define BOARDKIT_CORE_BOARD_EVENTS_H_

namespace boardkit {
namespace internal {

/// Creation tool selected by the host UI.
enum class Tool { kNone, kText, kShape };

/// Coarse notifications for UI and persistence collaborators. There are no
/// per-field events; observers re-read whatever they display.
class BoardObserver {
 public:
  virtual ~BoardObserver() = default;

  /// An add, delete, update or reorder was committed.
  virtual void OnObjectsChanged() {}

  /// The active tool changed. Tool::kNone is reported when a tool
  /// deactivates itself after creating an object.
  virtual void OnToolChanged(Tool tool) {}

  virtual void OnSelectionChanged() {}
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_CORE_BOARD_EVENTS_H_
