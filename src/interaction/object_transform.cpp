// Copyright 2026 The boardkit Authors

#include "interaction/object_transform.h"

#include <algorithm>

namespace boardkit {
namespace internal {

namespace {

bool MovesLeftEdge(HandleId h) {
  return h == HandleId::kNw || h == HandleId::kW || h == HandleId::kSw;
}
bool MovesRightEdge(HandleId h) {
  return h == HandleId::kNe || h == HandleId::kE || h == HandleId::kSe;
}
bool MovesTopEdge(HandleId h) {
  return h == HandleId::kNw || h == HandleId::kN || h == HandleId::kNe;
}
bool MovesBottomEdge(HandleId h) {
  return h == HandleId::kSw || h == HandleId::kS || h == HandleId::kSe;
}

void ResizeSegment(SceneObject* obj, HandleId handle, double x, double y) {
  ShapeBody* shape = obj->shape();
  if (handle == HandleId::kStart) {
    obj->x = x;
    obj->y = y;
  } else if (handle == HandleId::kEnd) {
    shape->x2 = x;
    shape->y2 = y;
  }
}

void ResizePalette(SceneObject* obj, HandleId handle, double x, double y,
                   const ResizeLimits& limits) {
  PaletteBody* palette = obj->palette();
  const double floor = limits.palette_resize_floor;
  const double right = obj->x + obj->width;
  const double bottom = obj->y + obj->height;

  // Cells follow the width only; the n and s handles leave it unchanged.
  double new_width = obj->width;
  if (MovesLeftEdge(handle)) {
    new_width = (std::max)(floor, right - x);
  } else if (MovesRightEdge(handle)) {
    new_width = (std::max)(floor, x - obj->x);
  }
  double scale = obj->width > 0 ? new_width / obj->width : 1.0;

  palette->cell_size =
      (std::max)(limits.min_palette_cell, palette->cell_size * scale);
  DerivePaletteGeometry(obj);

  // Keep the edge opposite the grabbed handle where it was.
  if (MovesLeftEdge(handle)) obj->x = right - obj->width;
  if (MovesTopEdge(handle)) obj->y = bottom - obj->height;
}

void ResizeBox(SceneObject* obj, HandleId handle, double x, double y,
               double min_size) {
  const double right = obj->x + obj->width;
  const double bottom = obj->y + obj->height;

  if (MovesRightEdge(handle)) {
    obj->width = (std::max)(min_size, x - obj->x);
  } else if (MovesLeftEdge(handle)) {
    double w = (std::max)(min_size, right - x);
    obj->x = right - w;
    obj->width = w;
  }

  if (MovesBottomEdge(handle)) {
    obj->height = (std::max)(min_size, y - obj->y);
  } else if (MovesTopEdge(handle)) {
    double h = (std::max)(min_size, bottom - y);
    obj->y = bottom - h;
    obj->height = h;
  }
}

}  // namespace

void ResizeObject(SceneObject* obj, HandleId handle, double x, double y,
                  const ResizeLimits& limits) {
  if (!obj) return;
  if (obj->IsSegment()) {
    ResizeSegment(obj, handle, x, y);
    return;
  }
  if (handle == HandleId::kStart || handle == HandleId::kEnd) return;
  if (obj->kind() == ObjectKind::kColorPalette) {
    ResizePalette(obj, handle, x, y, limits);
    return;
  }
  ResizeBox(obj, handle, x, y, limits.min_object_size);
}

Point ResizeAnchor(const SceneObject& obj, HandleId handle) {
  if (obj.IsSegment()) {
    const ShapeBody* shape = obj.shape();
    if (handle == HandleId::kStart) return {shape->x2, shape->y2};
    return {obj.x, obj.y};
  }
  return {MovesLeftEdge(handle) ? obj.x + obj.width : obj.x,
          MovesTopEdge(handle) ? obj.y + obj.height : obj.y};
}

RotationStart CaptureRotationStart(const SceneObject& obj) {
  RotationStart start;
  start.x = obj.x;
  start.y = obj.y;
  start.rotation = obj.rotation;
  if (const ShapeBody* shape = obj.shape()) {
    start.x2 = shape->x2;
    start.y2 = shape->y2;
  }
  return start;
}

void RotateFromStart(SceneObject* obj, const RotationStart& start,
                     const Point& pivot, double delta_degrees, bool orbit) {
  if (!obj) return;
  if (!orbit) {
    obj->rotation = start.rotation + delta_degrees;
    return;
  }

  if (obj->IsSegment()) {
    ShapeBody* shape = obj->shape();
    Point a = RotatePointAroundCenter(start.x, start.y, pivot.x, pivot.y,
                                     delta_degrees);
    Point b = RotatePointAroundCenter(start.x2, start.y2, pivot.x, pivot.y,
                                      delta_degrees);
    obj->x = a.x;
    obj->y = a.y;
    shape->x2 = b.x;
    shape->y2 = b.y;
    return;
  }

  Point center{start.x + obj->width / 2, start.y + obj->height / 2};
  Point moved = RotatePointAroundCenter(center.x, center.y, pivot.x,
                                         pivot.y, delta_degrees);
  obj->x = moved.x - obj->width / 2;
  obj->y = moved.y - obj->height / 2;
  obj->rotation = start.rotation + delta_degrees;
}

}  // namespace internal
}  // namespace boardkit
