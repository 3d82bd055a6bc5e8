// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_RENDER_SCENE_PAINTER_H_
#define BOARDKIT_RENDER_SCENE_PAINTER_H_

#include <optional>
#include <vector>

#include "geometry/geometry.h"
#include "interaction/selection_manager.h"
#include "interaction/snap_engine.h"
#include "render/render_adapter.h"
#include "scene/scene_model.h"

namespace boardkit {
namespace internal {

/// Everything that appears in one frame.
struct PaintFrame {
  const SceneModel* scene = nullptr;
  const SelectionManager* selection = nullptr;
  const Viewport* viewport = nullptr;
  const SceneObject* preview = nullptr;  // In-progress draw gesture.
  std::vector<SnapGuide> snap_guides;
  std::optional<Rect> box_selection;
  bool show_grid = false;
  double grid_size = 50.0;
};

/// Translates the board state into RenderAdapter calls: objects in zIndex
/// order, then the preview, selection chrome, snap guides and the box
/// selection rectangle.
class ScenePainter {
 public:
  /// Does NOT take ownership of adapter.
  explicit ScenePainter(RenderAdapter* adapter) : adapter_(adapter) {}

  /// Returns false if the adapter could not begin a frame.
  bool Paint(const PaintFrame& frame);

 private:
  void PaintObject(const SceneObject& obj);
  void PaintSelection(const SceneObject& obj, double zoom, bool handles);

  RenderAdapter* adapter_;  // Non-owning
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_RENDER_SCENE_PAINTER_H_
