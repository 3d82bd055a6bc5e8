// Copyright 2026 The boardkit Authors

#include "geometry/handles.h"

#include <algorithm>
#include <cmath>

namespace boardkit {
namespace internal {

namespace {

struct HandleNameEntry {
  HandleId id;
  const char* name;
};

constexpr HandleNameEntry kHandleNames[] = {
    {HandleId::kNw, "nw"}, {HandleId::kN, "n"},   {HandleId::kNe, "ne"},
    {HandleId::kE, "e"},   {HandleId::kSe, "se"}, {HandleId::kS, "s"},
    {HandleId::kSw, "sw"}, {HandleId::kW, "w"},   {HandleId::kStart, "start"},
    {HandleId::kEnd, "end"},
};

}  // namespace

const char* HandleName(HandleId id) {
  for (const auto& entry : kHandleNames) {
    if (entry.id == id) return entry.name;
  }
  return "";
}

std::optional<HandleId> HandleFromName(const std::string& name) {
  for (const auto& entry : kHandleNames) {
    if (name == entry.name) return entry.id;
  }
  return std::nullopt;
}

double LineHitThreshold(double stroke_width) {
  return (std::max)(10.0, stroke_width + 5.0);
}

std::vector<Handle> HandlePositions(const SceneObject& obj) {
  if (obj.IsSegment()) {
    const ShapeBody* s = obj.shape();
    return {{HandleId::kStart, {obj.x, obj.y}},
            {HandleId::kEnd, {s->x2, s->y2}}};
  }

  double l = obj.x;
  double t = obj.y;
  double r = obj.x + obj.width;
  double b = obj.y + obj.height;
  double cx = obj.x + obj.width / 2.0;
  double cy = obj.y + obj.height / 2.0;
  return {
      {HandleId::kNw, {l, t}},  {HandleId::kN, {cx, t}},
      {HandleId::kNe, {r, t}},  {HandleId::kE, {r, cy}},
      {HandleId::kSe, {r, b}},  {HandleId::kS, {cx, b}},
      {HandleId::kSw, {l, b}},  {HandleId::kW, {l, cy}},
  };
}

Point RotationHandlePosition(const SceneObject& obj, double zoom) {
  Rect bounds = ObjectBounds(obj);
  Point handle{bounds.x + bounds.width / 2.0,
               bounds.y - kRotationHandleOffset / zoom};
  if (obj.rotation != 0.0) {
    Point pivot = ObjectPivot(obj);
    handle = RotatePointAroundCenter(handle.x, handle.y, pivot.x, pivot.y,
                                     obj.rotation);
  }
  return handle;
}

Point ToObjectLocal(const SceneObject& obj, double x, double y) {
  if (obj.rotation == 0.0) return {x, y};
  Point pivot = ObjectPivot(obj);
  return RotatePointAroundCenter(x, y, pivot.x, pivot.y, -obj.rotation);
}

Point ToWorld(const SceneObject& obj, const Point& local) {
  if (obj.rotation == 0.0) return local;
  Point pivot = ObjectPivot(obj);
  return RotatePointAroundCenter(local.x, local.y, pivot.x, pivot.y,
                                 obj.rotation);
}

std::optional<HandleId> HitResizeHandle(const SceneObject& obj, double x,
                                        double y, double zoom) {
  Point local = ToObjectLocal(obj, x, y);
  double radius = HandleHitRadius(zoom);
  for (const Handle& h : HandlePositions(obj)) {
    if (Distance(local, h.position) < radius) return h.id;
  }
  return std::nullopt;
}

bool HitRotationHandle(const SceneObject& obj, double x, double y,
                       double zoom) {
  Point handle = RotationHandlePosition(obj, zoom);
  return Distance({x, y}, handle) < kRotationHandleHitRadius / zoom;
}

}  // namespace internal
}  // namespace boardkit
