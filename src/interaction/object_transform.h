// Copyright 2026 The boardkit Authors
// Geometric edits applied by resize and rotate gestures.

#ifndef BOARDKIT_INTERACTION_OBJECT_TRANSFORM_H_
#define BOARDKIT_INTERACTION_OBJECT_TRANSFORM_H_

#include "geometry/geometry.h"
#include "geometry/handles.h"
#include "scene/scene_object.h"

namespace boardkit {
namespace internal {

struct ResizeLimits {
  double min_object_size = 50.0;
  double min_palette_cell = 20.0;
  double palette_resize_floor = 60.0;
};

/// Resize obj by dragging handle to (x, y), given in obj's unrotated frame.
///
/// Line/arrow move the grabbed endpoint. Palettes rescale cell_size by the
/// width change and re-derive their size with the opposite edge fixed. Everything else keeps
/// the opposite edge fixed and clamps width/height to min_object_size.
void ResizeObject(SceneObject* obj, HandleId handle, double x, double y,
                  const ResizeLimits& limits);

/// Point of obj (unrotated frame) that a resize through handle keeps in
/// place: the opposite corner, or the other endpoint of a line/arrow.
Point ResizeAnchor(const SceneObject& obj, HandleId handle);

/// Starting pose of an object taking part in a rotate gesture.
struct RotationStart {
  double x = 0.0;
  double y = 0.0;
  double x2 = 0.0;
  double y2 = 0.0;
  double rotation = 0.0;
};

RotationStart CaptureRotationStart(const SceneObject& obj);

/// Rotate obj by delta_degrees relative to its starting pose. With
/// orbit set, the object's pivot also travels around pivot; line/arrow
/// endpoints are rotated directly instead of changing the rotation field.
void RotateFromStart(SceneObject* obj, const RotationStart& start,
                     const Point& pivot, double delta_degrees, bool orbit);

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_INTERACTION_OBJECT_TRANSFORM_H_
