// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_SCENE_SCENE_OBJECT_H_
#define BOARDKIT_SCENE_SCENE_OBJECT_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "geometry/geometry.h"

namespace boardkit {
namespace internal {

/// Colour in ARGB format (0xAARRGGBB).
using Color = uint32_t;

constexpr Color kColorBlack = 0xFF000000;
constexpr Color kDefaultFillColor = 0xFF3B82F6;

// ---------------------------------------------------------------------------
// Shape variant
// ---------------------------------------------------------------------------

enum class ShapeType {
  kSquare,
  kRectangle,
  kCircle,
  kTriangle,
  kLine,
  kArrow,
  kPolygon,
};

const char* ShapeTypeName(ShapeType type);

/// Line and arrow store an explicit endpoint instead of width/height.
inline bool IsSegmentShape(ShapeType type) {
  return type == ShapeType::kLine || type == ShapeType::kArrow;
}

struct ShapeBody {
  ShapeType shape_type = ShapeType::kRectangle;
  Color fill_color = kDefaultFillColor;
  bool has_stroke = true;
  Color stroke_color = kColorBlack;
  double stroke_width = 2.0;
  std::optional<double> corner_radius;
  std::optional<int> sides;  // Polygon only.
  double x2 = 0.0;           // Line/arrow endpoint.
  double y2 = 0.0;
};

// ---------------------------------------------------------------------------
// Text variant
// ---------------------------------------------------------------------------

enum class FontWeight { kNormal, kBold };
enum class FontStyle { kNormal, kItalic };
enum class TextDecoration { kNone, kUnderline, kLineThrough };
enum class TextAlign { kLeft, kCenter, kRight };

struct TextStyle {
  double font_size = 32.0;
  std::string font_family = "Arial";
  FontWeight font_weight = FontWeight::kNormal;
  FontStyle font_style = FontStyle::kNormal;
  Color color = kColorBlack;
  TextDecoration text_decoration = TextDecoration::kNone;
};

bool operator==(const TextStyle& a, const TextStyle& b);
inline bool operator!=(const TextStyle& a, const TextStyle& b) {
  return !(a == b);
}

/// A contiguous span of text sharing one style.
struct TextRun {
  std::string text;
  TextStyle style;
};

bool operator==(const TextRun& a, const TextRun& b);

/// Flat single-style text fields found on records written before rich text.
struct LegacyText {
  std::string text;
  double font_size = 32.0;
  std::string font_family = "Arial";
  FontWeight font_weight = FontWeight::kNormal;
  Color color = kColorBlack;
};

bool operator==(const LegacyText& a, const LegacyText& b);

struct TextBody {
  std::vector<TextRun> content;
  TextStyle default_style;
  TextAlign text_align = TextAlign::kLeft;
  bool is_editing = false;
  std::optional<LegacyText> legacy;  // Present only until migrated.
};

// ---------------------------------------------------------------------------
// Colour palette variant
// ---------------------------------------------------------------------------

struct PaletteBody {
  double cell_size = 40.0;
  int grid_cols = 5;
  int grid_rows = 1;
  bool has_wide_cell = false;
  std::vector<Color> colors;
};

bool operator==(const ShapeBody& a, const ShapeBody& b);
bool operator==(const TextBody& a, const TextBody& b);
bool operator==(const PaletteBody& a, const PaletteBody& b);

// ---------------------------------------------------------------------------
// SceneObject
// ---------------------------------------------------------------------------

/// Alternative order matches ObjectKind.
using ObjectBody = std::variant<ShapeBody, TextBody, PaletteBody>;

enum class ObjectKind { kShape = 0, kText = 1, kColorPalette = 2 };

const char* ObjectKindName(ObjectKind kind);

/// One placed object on the board. Value type: copies are deep snapshots.
struct SceneObject {
  std::string id;
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
  double rotation = 0.0;  // Degrees.
  int z_index = 0;
  bool visible = true;
  ObjectBody body;

  ObjectKind kind() const { return static_cast<ObjectKind>(body.index()); }

  ShapeBody* shape() { return std::get_if<ShapeBody>(&body); }
  const ShapeBody* shape() const { return std::get_if<ShapeBody>(&body); }
  TextBody* text() { return std::get_if<TextBody>(&body); }
  const TextBody* text() const { return std::get_if<TextBody>(&body); }
  PaletteBody* palette() { return std::get_if<PaletteBody>(&body); }
  const PaletteBody* palette() const { return std::get_if<PaletteBody>(&body); }

  /// True for line/arrow shapes.
  bool IsSegment() const;
};

bool operator==(const SceneObject& a, const SceneObject& b);
inline bool operator!=(const SceneObject& a, const SceneObject& b) {
  return !(a == b);
}

/// Recompute width/height of a palette from its grid. No-op for other kinds.
void DerivePaletteGeometry(SceneObject* obj);

/// Axis-aligned bounds ignoring rotation. For line/arrow this is the box
/// spanned by the two endpoints.
Rect ObjectBounds(const SceneObject& obj);

/// Rotation pivot: the geometric centre, or the segment midpoint.
Point ObjectPivot(const SceneObject& obj);

/// Translate the object (both endpoints for line/arrow).
void TranslateObject(SceneObject* obj, double dx, double dy);

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_SCENE_SCENE_OBJECT_H_
