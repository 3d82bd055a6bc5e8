// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_PLATFORM_LINUX_CAIRO_RENDER_ADAPTER_H_
#define BOARDKIT_PLATFORM_LINUX_CAIRO_RENDER_ADAPTER_H_

#include <cstdint>

#include "render/render_adapter.h"

typedef struct _cairo cairo_t;
typedef struct _cairo_surface cairo_surface_t;

namespace boardkit {
namespace internal {

/// Board renderer using Cairo + Pango over a BGRA8 pixel buffer.
class CairoRenderAdapter : public RenderAdapter {
 public:
  /// Background painted by BeginFrame().
  static constexpr Color kBackgroundColor = 0xFFFFFFFF;
  static constexpr Color kSelectionColor = 0xFF3B82F6;
  static constexpr Color kGuideColor = 0xFFEC4899;
  static constexpr Color kGridColor = 0xFFE5E7EB;

  CairoRenderAdapter(uint8_t* pixels, int width, int height, int stride);
  ~CairoRenderAdapter() override;

  bool BeginFrame(const Viewport& viewport) override;
  void EndFrame() override;

  void PushRotation(const Point& pivot, double degrees) override;
  void PopRotation() override;

  void DrawGrid(double grid_size) override;

  void DrawShape(const SceneObject& obj, const ShapeBody& shape) override;
  void DrawTextBox(const SceneObject& obj, const TextBody& text,
                   bool draw_glyphs) override;
  void DrawPalette(const SceneObject& obj,
                   const PaletteBody& palette) override;

  void DrawSelectionBox(const Rect& bounds) override;
  void DrawResizeHandle(const Point& center, double radius) override;
  void DrawRotationHandle(const Point& center, const Point& anchor,
                          double radius) override;
  void DrawSnapGuide(const SnapGuide& guide) override;
  void DrawBoxSelection(const Rect& rect) override;

 private:
  void FillAndStroke(const ShapeBody& shape);
  void DrawArrowHead(double x1, double y1, double x2, double y2,
                     double stroke_width);

  uint8_t* pixels_;
  int width_;
  int height_;
  int stride_;
  double zoom_ = 1.0;
  Rect visible_world_;
  cairo_surface_t* surface_ = nullptr;
  cairo_t* cr_ = nullptr;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_PLATFORM_LINUX_CAIRO_RENDER_ADAPTER_H_
