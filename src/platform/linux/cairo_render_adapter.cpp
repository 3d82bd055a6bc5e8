// Copyright 2026 The boardkit Authors
// Linux board renderer: Cairo + Pango implementation.

#include "platform/linux/cairo_render_adapter.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>

#include <cairo/cairo.h>
#include <pango/pangocairo.h>

#include "core/logger.h"

namespace boardkit {
namespace internal {

namespace {

constexpr double kTextPadding = 10.0;
constexpr int kDefaultPolygonSides = 6;

void SetSourceArgb(cairo_t* cr, Color c) {
  double a = static_cast<double>((c >> 24) & 0xFF) / 255.0;
  double r = static_cast<double>((c >> 16) & 0xFF) / 255.0;
  double g = static_cast<double>((c >> 8) & 0xFF) / 255.0;
  double b = static_cast<double>(c & 0xFF) / 255.0;
  cairo_set_source_rgba(cr, r, g, b, a);
}

void RoundedRectPath(cairo_t* cr, double x, double y, double w, double h,
                     double radius) {
  radius = (std::min)(radius, (std::min)(w, h) / 2);
  if (radius <= 0) {
    cairo_rectangle(cr, x, y, w, h);
    return;
  }
  cairo_new_sub_path(cr);
  cairo_arc(cr, x + w - radius, y + radius, radius, -kPi / 2, 0);
  cairo_arc(cr, x + w - radius, y + h - radius, radius, 0, kPi / 2);
  cairo_arc(cr, x + radius, y + h - radius, radius, kPi / 2, kPi);
  cairo_arc(cr, x + radius, y + radius, radius, kPi, 3 * kPi / 2);
  cairo_close_path(cr);
}

guint16 Channel16(Color c, int shift) {
  return static_cast<guint16>(((c >> shift) & 0xFF) * 257);
}

/// Pango attributes for one run covering bytes [start, end).
void AddRunAttributes(PangoAttrList* attrs, const TextStyle& style,
                      guint start, guint end) {
  auto add = [&](PangoAttribute* attr) {
    attr->start_index = start;
    attr->end_index = end;
    pango_attr_list_insert(attrs, attr);
  };
  add(pango_attr_family_new(style.font_family.c_str()));
  add(pango_attr_size_new_absolute(
      static_cast<int>(style.font_size * PANGO_SCALE)));
  add(pango_attr_weight_new(style.font_weight == FontWeight::kBold
                                ? PANGO_WEIGHT_BOLD
                                : PANGO_WEIGHT_NORMAL));
  add(pango_attr_style_new(style.font_style == FontStyle::kItalic
                               ? PANGO_STYLE_ITALIC
                               : PANGO_STYLE_NORMAL));
  add(pango_attr_foreground_new(Channel16(style.color, 16),
                                Channel16(style.color, 8),
                                Channel16(style.color, 0)));
  add(pango_attr_foreground_alpha_new(Channel16(style.color, 24)));
  if (style.text_decoration == TextDecoration::kUnderline) {
    add(pango_attr_underline_new(PANGO_UNDERLINE_SINGLE));
  } else if (style.text_decoration == TextDecoration::kLineThrough) {
    add(pango_attr_strikethrough_new(TRUE));
  }
}

}  // namespace

CairoRenderAdapter::CairoRenderAdapter(uint8_t* pixels, int width, int height,
                                       int stride)
    : pixels_(pixels), width_(width), height_(height), stride_(stride) {}

CairoRenderAdapter::~CairoRenderAdapter() { EndFrame(); }

// -----------------------------------------------------------------------
// Begin / End
// -----------------------------------------------------------------------

bool CairoRenderAdapter::BeginFrame(const Viewport& viewport) {
  if (!pixels_ || width_ <= 0 || height_ <= 0) return false;
  EndFrame();

  // BGRA8 matches CAIRO_FORMAT_ARGB32 on little-endian.
  surface_ = cairo_image_surface_create_for_data(
      pixels_, CAIRO_FORMAT_ARGB32, width_, height_, stride_);
  if (cairo_surface_status(surface_) != CAIRO_STATUS_SUCCESS) {
    BOARDKIT_LOG_ERROR("Cannot wrap {}x{} buffer (stride {}) for Cairo",
                       width_, height_, stride_);
    cairo_surface_destroy(surface_);
    surface_ = nullptr;
    return false;
  }
  cr_ = cairo_create(surface_);

  SetSourceArgb(cr_, kBackgroundColor);
  cairo_paint(cr_);

  zoom_ = viewport.zoom();
  Point top_left = viewport.ScreenToWorld(0, 0);
  Point bottom_right = viewport.ScreenToWorld(width_, height_);
  visible_world_ = NormalizedRect(top_left, bottom_right);

  cairo_translate(cr_, viewport.pan_x(), viewport.pan_y());
  cairo_scale(cr_, zoom_, zoom_);
  return true;
}

void CairoRenderAdapter::EndFrame() {
  if (cr_) {
    cairo_destroy(cr_);
    cr_ = nullptr;
  }
  if (surface_) {
    cairo_surface_flush(surface_);
    cairo_surface_destroy(surface_);
    surface_ = nullptr;
  }
}

void CairoRenderAdapter::PushRotation(const Point& pivot, double degrees) {
  if (!cr_) return;
  cairo_save(cr_);
  cairo_translate(cr_, pivot.x, pivot.y);
  cairo_rotate(cr_, DegreesToRadians(degrees));
  cairo_translate(cr_, -pivot.x, -pivot.y);
}

void CairoRenderAdapter::PopRotation() {
  if (cr_) cairo_restore(cr_);
}

void CairoRenderAdapter::DrawGrid(double grid_size) {
  if (!cr_ || grid_size <= 0) return;
  const Rect& v = visible_world_;
  SetSourceArgb(cr_, kGridColor);
  cairo_set_line_width(cr_, 1.0 / zoom_);
  for (double gx = std::floor(v.x / grid_size) * grid_size; gx <= v.right();
       gx += grid_size) {
    cairo_move_to(cr_, gx, v.y);
    cairo_line_to(cr_, gx, v.bottom());
  }
  for (double gy = std::floor(v.y / grid_size) * grid_size; gy <= v.bottom();
       gy += grid_size) {
    cairo_move_to(cr_, v.x, gy);
    cairo_line_to(cr_, v.right(), gy);
  }
  cairo_stroke(cr_);
}

// -----------------------------------------------------------------------
// Object bodies
// -----------------------------------------------------------------------

void CairoRenderAdapter::FillAndStroke(const ShapeBody& shape) {
  SetSourceArgb(cr_, shape.fill_color);
  if (shape.has_stroke) {
    cairo_fill_preserve(cr_);
    SetSourceArgb(cr_, shape.stroke_color);
    cairo_set_line_width(cr_, shape.stroke_width);
    cairo_stroke(cr_);
  } else {
    cairo_fill(cr_);
  }
}

void CairoRenderAdapter::DrawArrowHead(double x1, double y1, double x2,
                                       double y2, double stroke_width) {
  double angle = std::atan2(y2 - y1, x2 - x1);
  double head = (std::max)(10.0, stroke_width * 3);
  const double spread = kPi / 6;
  cairo_move_to(cr_, x2, y2);
  cairo_line_to(cr_, x2 - head * std::cos(angle - spread),
                y2 - head * std::sin(angle - spread));
  cairo_move_to(cr_, x2, y2);
  cairo_line_to(cr_, x2 - head * std::cos(angle + spread),
                y2 - head * std::sin(angle + spread));
  cairo_stroke(cr_);
}

void CairoRenderAdapter::DrawShape(const SceneObject& obj,
                                   const ShapeBody& shape) {
  if (!cr_) return;
  cairo_new_path(cr_);

  const double x = obj.x;
  const double y = obj.y;
  const double w = obj.width;
  const double h = obj.height;

  switch (shape.shape_type) {
    case ShapeType::kSquare:
    case ShapeType::kRectangle:
      RoundedRectPath(cr_, x, y, w, h, shape.corner_radius.value_or(0.0));
      FillAndStroke(shape);
      break;
    case ShapeType::kCircle:
      cairo_arc(cr_, x + w / 2, y + h / 2, (std::min)(w, h) / 2, 0, 2 * kPi);
      FillAndStroke(shape);
      break;
    case ShapeType::kTriangle:
      cairo_move_to(cr_, x + w / 2, y);
      cairo_line_to(cr_, x + w, y + h);
      cairo_line_to(cr_, x, y + h);
      cairo_close_path(cr_);
      FillAndStroke(shape);
      break;
    case ShapeType::kPolygon: {
      int sides = (std::max)(3, shape.sides.value_or(kDefaultPolygonSides));
      double cx = x + w / 2;
      double cy = y + h / 2;
      double radius = (std::min)(w, h) / 2;
      for (int i = 0; i < sides; ++i) {
        double a = 2 * kPi * i / sides - kPi / 2;
        double px = cx + radius * std::cos(a);
        double py = cy + radius * std::sin(a);
        if (i == 0) {
          cairo_move_to(cr_, px, py);
        } else {
          cairo_line_to(cr_, px, py);
        }
      }
      cairo_close_path(cr_);
      FillAndStroke(shape);
      break;
    }
    case ShapeType::kLine:
    case ShapeType::kArrow:
      // Segments are painted with the stroke colour, or the fill colour
      // when the stroke is switched off.
      SetSourceArgb(cr_, shape.has_stroke ? shape.stroke_color
                                          : shape.fill_color);
      cairo_set_line_width(cr_, shape.stroke_width);
      cairo_set_line_cap(cr_, CAIRO_LINE_CAP_ROUND);
      cairo_move_to(cr_, x, y);
      cairo_line_to(cr_, shape.x2, shape.y2);
      cairo_stroke(cr_);
      if (shape.shape_type == ShapeType::kArrow) {
        DrawArrowHead(x, y, shape.x2, shape.y2, shape.stroke_width);
      }
      break;
  }
}

void CairoRenderAdapter::DrawTextBox(const SceneObject& obj,
                                     const TextBody& text, bool draw_glyphs) {
  if (!cr_) return;
  if (text.is_editing) {
    // Outline of the box under the editing surface.
    SetSourceArgb(cr_, kSelectionColor);
    cairo_set_line_width(cr_, 1.0 / zoom_);
    cairo_rectangle(cr_, obj.x, obj.y, obj.width, obj.height);
    cairo_stroke(cr_);
  }
  if (!draw_glyphs || text.content.empty()) return;

  std::string plain;
  PangoAttrList* attrs = pango_attr_list_new();
  for (const TextRun& run : text.content) {
    guint start = static_cast<guint>(plain.size());
    plain += run.text;
    AddRunAttributes(attrs, run.style, start,
                     static_cast<guint>(plain.size()));
  }

  PangoLayout* layout = pango_cairo_create_layout(cr_);
  pango_layout_set_text(layout, plain.c_str(), static_cast<int>(plain.size()));
  pango_layout_set_attributes(layout, attrs);
  pango_attr_list_unref(attrs);

  double inner_width = (std::max)(0.0, obj.width - 2 * kTextPadding);
  pango_layout_set_width(layout, static_cast<int>(inner_width * PANGO_SCALE));
  pango_layout_set_wrap(layout, PANGO_WRAP_WORD_CHAR);
  switch (text.text_align) {
    case TextAlign::kLeft:
      pango_layout_set_alignment(layout, PANGO_ALIGN_LEFT);
      break;
    case TextAlign::kCenter:
      pango_layout_set_alignment(layout, PANGO_ALIGN_CENTER);
      break;
    case TextAlign::kRight:
      pango_layout_set_alignment(layout, PANGO_ALIGN_RIGHT);
      break;
  }

  cairo_save(cr_);
  cairo_rectangle(cr_, obj.x, obj.y, obj.width, obj.height);
  cairo_clip(cr_);
  cairo_move_to(cr_, obj.x + kTextPadding, obj.y + kTextPadding);
  pango_cairo_show_layout(cr_, layout);
  cairo_restore(cr_);
  g_object_unref(layout);
}

void CairoRenderAdapter::DrawPalette(const SceneObject& obj,
                                     const PaletteBody& palette) {
  if (!cr_) return;
  const double cell = palette.cell_size;
  const size_t grid_cells =
      static_cast<size_t>(palette.grid_cols) * palette.grid_rows;

  cairo_set_line_width(cr_, 1.0 / zoom_);
  for (int row = 0; row < palette.grid_rows; ++row) {
    for (int col = 0; col < palette.grid_cols; ++col) {
      size_t index = static_cast<size_t>(row) * palette.grid_cols + col;
      Color c = index < palette.colors.size() ? palette.colors[index]
                                              : kBackgroundColor;
      cairo_rectangle(cr_, obj.x + col * cell, obj.y + row * cell, cell, cell);
      SetSourceArgb(cr_, c);
      cairo_fill_preserve(cr_);
      SetSourceArgb(cr_, kGridColor);
      cairo_stroke(cr_);
    }
  }

  if (palette.has_wide_cell) {
    Color c = grid_cells < palette.colors.size() ? palette.colors[grid_cells]
                                                 : kBackgroundColor;
    cairo_rectangle(cr_, obj.x, obj.y + palette.grid_rows * cell,
                    palette.grid_cols * cell, cell);
    SetSourceArgb(cr_, c);
    cairo_fill_preserve(cr_);
    SetSourceArgb(cr_, kGridColor);
    cairo_stroke(cr_);
  }
}

// -----------------------------------------------------------------------
// Chrome
// -----------------------------------------------------------------------

void CairoRenderAdapter::DrawSelectionBox(const Rect& bounds) {
  if (!cr_) return;
  SetSourceArgb(cr_, kSelectionColor);
  cairo_set_line_width(cr_, 2.0 / zoom_);
  cairo_rectangle(cr_, bounds.x, bounds.y, bounds.width, bounds.height);
  cairo_stroke(cr_);
}

void CairoRenderAdapter::DrawResizeHandle(const Point& center, double radius) {
  if (!cr_) return;
  cairo_new_path(cr_);
  cairo_arc(cr_, center.x, center.y, radius / 2, 0, 2 * kPi);
  SetSourceArgb(cr_, kBackgroundColor);
  cairo_fill_preserve(cr_);
  SetSourceArgb(cr_, kSelectionColor);
  cairo_set_line_width(cr_, 1.5 / zoom_);
  cairo_stroke(cr_);
}

void CairoRenderAdapter::DrawRotationHandle(const Point& center,
                                            const Point& anchor,
                                            double radius) {
  if (!cr_) return;
  SetSourceArgb(cr_, kSelectionColor);
  cairo_set_line_width(cr_, 1.0 / zoom_);
  cairo_move_to(cr_, anchor.x, anchor.y);
  cairo_line_to(cr_, center.x, center.y);
  cairo_stroke(cr_);
  DrawResizeHandle(center, radius);
}

void CairoRenderAdapter::DrawSnapGuide(const SnapGuide& guide) {
  if (!cr_) return;
  const Rect& v = visible_world_;
  SetSourceArgb(cr_, kGuideColor);
  cairo_set_line_width(cr_, 1.0 / zoom_);
  if (guide.orientation == SnapGuide::Orientation::kVertical) {
    cairo_move_to(cr_, guide.position, v.y);
    cairo_line_to(cr_, guide.position, v.bottom());
  } else {
    cairo_move_to(cr_, v.x, guide.position);
    cairo_line_to(cr_, v.right(), guide.position);
  }
  cairo_stroke(cr_);
}

void CairoRenderAdapter::DrawBoxSelection(const Rect& rect) {
  if (!cr_) return;
  cairo_rectangle(cr_, rect.x, rect.y, rect.width, rect.height);
  cairo_set_source_rgba(cr_, 0.23, 0.51, 0.96, 0.1);
  cairo_fill_preserve(cr_);
  SetSourceArgb(cr_, kSelectionColor);
  cairo_set_line_width(cr_, 1.0 / zoom_);
  double dash = 4.0 / zoom_;
  cairo_set_dash(cr_, &dash, 1, 0);
  cairo_stroke(cr_);
  cairo_set_dash(cr_, nullptr, 0, 0);
}

// Factory.
std::unique_ptr<RenderAdapter> CreateBufferRenderAdapter(uint8_t* pixels,
                                                         int width, int height,
                                                         int stride) {
  if (!pixels || width <= 0 || height <= 0 || stride < width * 4) {
    return nullptr;
  }
  return std::make_unique<CairoRenderAdapter>(pixels, width, height, stride);
}

}  // namespace internal
}  // namespace boardkit
