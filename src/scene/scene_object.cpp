// Copyright 2026 The boardkit Authors

#include "scene/scene_object.h"

#include <algorithm>
#include <cmath>

namespace boardkit {
namespace internal {

const char* ShapeTypeName(ShapeType type) {
  switch (type) {
    case ShapeType::kSquare:    return "square";
    case ShapeType::kRectangle: return "rectangle";
    case ShapeType::kCircle:    return "circle";
    case ShapeType::kTriangle:  return "triangle";
    case ShapeType::kLine:      return "line";
    case ShapeType::kArrow:     return "arrow";
    case ShapeType::kPolygon:   return "polygon";
  }
  return "unknown";
}

const char* ObjectKindName(ObjectKind kind) {
  switch (kind) {
    case ObjectKind::kShape:        return "shape";
    case ObjectKind::kText:         return "text";
    case ObjectKind::kColorPalette: return "colorPalette";
  }
  return "unknown";
}

bool operator==(const TextStyle& a, const TextStyle& b) {
  return a.font_size == b.font_size && a.font_family == b.font_family &&
         a.font_weight == b.font_weight && a.font_style == b.font_style &&
         a.color == b.color && a.text_decoration == b.text_decoration;
}

bool operator==(const TextRun& a, const TextRun& b) {
  return a.text == b.text && a.style == b.style;
}

bool operator==(const LegacyText& a, const LegacyText& b) {
  return a.text == b.text && a.font_size == b.font_size &&
         a.font_family == b.font_family && a.font_weight == b.font_weight &&
         a.color == b.color;
}

bool operator==(const ShapeBody& a, const ShapeBody& b) {
  return a.shape_type == b.shape_type && a.fill_color == b.fill_color &&
         a.has_stroke == b.has_stroke && a.stroke_color == b.stroke_color &&
         a.stroke_width == b.stroke_width &&
         a.corner_radius == b.corner_radius && a.sides == b.sides &&
         a.x2 == b.x2 && a.y2 == b.y2;
}

bool operator==(const TextBody& a, const TextBody& b) {
  return a.content == b.content && a.default_style == b.default_style &&
         a.text_align == b.text_align && a.is_editing == b.is_editing &&
         a.legacy == b.legacy;
}

bool operator==(const PaletteBody& a, const PaletteBody& b) {
  return a.cell_size == b.cell_size && a.grid_cols == b.grid_cols &&
         a.grid_rows == b.grid_rows && a.has_wide_cell == b.has_wide_cell &&
         a.colors == b.colors;
}

bool operator==(const SceneObject& a, const SceneObject& b) {
  return a.id == b.id && a.x == b.x && a.y == b.y && a.width == b.width &&
         a.height == b.height && a.rotation == b.rotation &&
         a.z_index == b.z_index && a.visible == b.visible && a.body == b.body;
}

bool SceneObject::IsSegment() const {
  const ShapeBody* s = shape();
  return s && IsSegmentShape(s->shape_type);
}

void DerivePaletteGeometry(SceneObject* obj) {
  PaletteBody* p = obj->palette();
  if (!p) return;
  obj->width = p->grid_cols * p->cell_size;
  obj->height = (p->grid_rows + (p->has_wide_cell ? 1 : 0)) * p->cell_size;
}

Rect ObjectBounds(const SceneObject& obj) {
  if (obj.IsSegment()) {
    const ShapeBody* s = obj.shape();
    return NormalizedRect({obj.x, obj.y}, {s->x2, s->y2});
  }
  return {obj.x, obj.y, obj.width, obj.height};
}

Point ObjectPivot(const SceneObject& obj) {
  if (obj.IsSegment()) {
    const ShapeBody* s = obj.shape();
    return {(obj.x + s->x2) / 2.0, (obj.y + s->y2) / 2.0};
  }
  return {obj.x + obj.width / 2.0, obj.y + obj.height / 2.0};
}

void TranslateObject(SceneObject* obj, double dx, double dy) {
  obj->x += dx;
  obj->y += dy;
  if (obj->IsSegment()) {
    ShapeBody* s = obj->shape();
    s->x2 += dx;
    s->y2 += dy;
  }
}

}  // namespace internal
}  // namespace boardkit
