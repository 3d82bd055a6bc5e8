// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_CORE_BOARD_CONTEXT_H_
#define BOARDKIT_CORE_BOARD_CONTEXT_H_

#include <cstdint>
#include <string>

#include "boardkit/boardkit.h"
#include "core/board_events.h"
#include "core/board_settings.h"
#include "geometry/geometry.h"
#include "history/history_manager.h"
#include "interaction/buffer_text_surface.h"
#include "interaction/interaction_controller.h"
#include "interaction/selection_manager.h"
#include "interaction/snap_engine.h"
#include "scene/scene_model.h"

namespace boardkit {
namespace internal {

/// Internal implementation of the opaque BoardKitBoard handle.
///
/// Owns one board's scene, selection, history and interaction state, and
/// bridges the public C API to them. Also forwards internal notifications to
/// the registered BoardKitObserver.
class BoardContextImpl : public SceneListener, public BoardObserver {
 public:
  BoardContextImpl();
  ~BoardContextImpl() override;

  // Non-copyable.
  BoardContextImpl(const BoardContextImpl&) = delete;
  BoardContextImpl& operator=(const BoardContextImpl&) = delete;

  // -- Error state --

  BoardKitError last_error() const { return last_error_; }
  const char* last_error_message() const { return last_error_message_.c_str(); }

  void SetError(BoardKitError code, const std::string& message);
  void ClearError();

  // -- Components --

  SceneModel& scene() { return scene_; }
  const SceneModel& scene() const { return scene_; }
  SelectionManager& selection() { return selection_; }
  const SelectionManager& selection() const { return selection_; }
  HistoryManager& history() { return history_; }
  const HistoryManager& history() const { return history_; }
  InteractionController& controller() { return controller_; }
  const InteractionController& controller() const { return controller_; }
  SnapEngine& snap_engine() { return snap_engine_; }
  BufferTextSurface& text_surface() { return text_surface_; }
  const BufferTextSurface& text_surface() const { return text_surface_; }
  const Viewport& viewport() const { return viewport_; }
  const BoardSettings& settings() const { return settings_; }

  // -- Observer --

  /// Copy the observer table (NULL clears it).
  void SetObserver(const BoardKitObserver* observer);

  /// Host callbacks for the inline editing surface (NULL clears them).
  void SetTextSurfaceCallbacks(const BoardKitTextSurfaceCallbacks* callbacks);

  // -- Viewport --

  Point ToWorld(double screen_x, double screen_y) const {
    return viewport_.ScreenToWorld(screen_x, screen_y);
  }

  void SetViewport(double zoom, double pan_x, double pan_y);
  void ZoomAt(double screen_x, double screen_y, double factor);
  void PanBy(double dx, double dy);
  bool FitToContent(int view_width, int view_height);

  // -- Settings --

  /// Load from path (empty = default location) and apply.
  bool LoadSettings(const std::string& path);
  bool SaveSettings(const std::string& path) const;
  void SetSnapping(bool enabled, double threshold);
  void SetMaxHistory(int max_history);

  // -- Rendering --

  BoardKitError RenderToBuffer(uint8_t* bgra, int width, int height,
                               int stride);

  // SceneListener:
  void OnObjectsChanged() override;

  // BoardObserver (from the interaction controller):
  void OnToolChanged(Tool tool) override;

 private:
  void ApplySettings();
  void ViewportChanged();

  BoardSettings settings_;
  Viewport viewport_;
  SceneModel scene_;
  SelectionManager selection_;
  HistoryManager history_;
  SnapEngine snap_engine_;
  BufferTextSurface text_surface_;
  InteractionController controller_;

  BoardKitObserver observer_ = {};
  BoardKitTextSurfaceCallbacks surface_callbacks_ = {};

  // Error state (per-board).
  BoardKitError last_error_ = kBoardKitOk;
  std::string last_error_message_ = "No error";
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_CORE_BOARD_CONTEXT_H_
