// Copyright 2026 The boardkit Authors

#include "render/scene_painter.h"

#include <type_traits>
#include <variant>

#include "geometry/handles.h"

namespace boardkit {
namespace internal {

bool ScenePainter::Paint(const PaintFrame& frame) {
  if (!adapter_ || !frame.scene || !frame.viewport) return false;
  if (!adapter_->BeginFrame(*frame.viewport)) return false;

  const double zoom = frame.viewport->zoom();
  if (frame.show_grid && frame.grid_size > 0) {
    adapter_->DrawGrid(frame.grid_size);
  }

  for (const SceneObject* obj : frame.scene->ObjectsByZOrder()) {
    if (obj->visible) PaintObject(*obj);
  }
  if (frame.preview) PaintObject(*frame.preview);

  if (frame.selection) {
    // Handles only make sense for a single selection.
    const bool handles = frame.selection->IsSingle();
    for (const std::string& id : frame.selection->ids()) {
      const SceneObject* obj = frame.scene->Find(id);
      if (obj && obj->visible) PaintSelection(*obj, zoom, handles);
    }
  }

  for (const SnapGuide& guide : frame.snap_guides) {
    adapter_->DrawSnapGuide(guide);
  }
  if (frame.box_selection) adapter_->DrawBoxSelection(*frame.box_selection);

  adapter_->EndFrame();
  return true;
}

void ScenePainter::PaintObject(const SceneObject& obj) {
  const bool rotated = obj.rotation != 0.0;
  if (rotated) adapter_->PushRotation(ObjectPivot(obj), obj.rotation);

  std::visit(
      [&](const auto& body) {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, ShapeBody>) {
          adapter_->DrawShape(obj, body);
        } else if constexpr (std::is_same_v<T, TextBody>) {
          adapter_->DrawTextBox(obj, body, !body.is_editing);
        } else if constexpr (std::is_same_v<T, PaletteBody>) {
          adapter_->DrawPalette(obj, body);
        }
      },
      obj.body);

  if (rotated) adapter_->PopRotation();
}

void ScenePainter::PaintSelection(const SceneObject& obj, double zoom,
                                  bool handles) {
  const bool rotated = obj.rotation != 0.0;
  if (rotated) adapter_->PushRotation(ObjectPivot(obj), obj.rotation);

  Rect bounds = ObjectBounds(obj);
  if (!obj.IsSegment()) adapter_->DrawSelectionBox(bounds);
  if (handles) {
    for (const Handle& handle : HandlePositions(obj)) {
      adapter_->DrawResizeHandle(handle.position, HandleHitRadius(zoom));
    }
  }

  if (rotated) adapter_->PopRotation();

  // RotationHandlePosition already includes the object's rotation.
  Point top{bounds.x + bounds.width / 2, bounds.y};
  if (rotated) {
    Point pivot = ObjectPivot(obj);
    top = RotatePointAroundCenter(top.x, top.y, pivot.x, pivot.y,
                                  obj.rotation);
  }
  adapter_->DrawRotationHandle(RotationHandlePosition(obj, zoom), top,
                               kRotationHandleHitRadius / zoom);
}

}  // namespace internal
}  // namespace boardkit
