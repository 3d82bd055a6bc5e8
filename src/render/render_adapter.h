// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_RENDER_RENDER_ADAPTER_H_
#define BOARDKIT_RENDER_RENDER_ADAPTER_H_

#include <cstdint>
#include <memory>

#include "geometry/geometry.h"
#include "interaction/snap_engine.h"
#include "scene/scene_object.h"

namespace boardkit {
namespace internal {

/// Abstract drawing back-end for the board.
///
/// Every coordinate is in world units; the adapter applies the viewport
/// given to BeginFrame(). Sizes that must stay constant on screen (handle
/// radii) are passed already divided by the zoom.
class RenderAdapter {
 public:
  virtual ~RenderAdapter() = default;

  // Non-copyable.
  RenderAdapter(const RenderAdapter&) = delete;
  RenderAdapter& operator=(const RenderAdapter&) = delete;

  /// Clear the target and install the viewport transform.
  /// @return true on success.
  virtual bool BeginFrame(const Viewport& viewport) = 0;

  /// Flush all drawing to the target.
  virtual void EndFrame() = 0;

  /// Rotate subsequent drawing by degrees about pivot. Calls nest.
  virtual void PushRotation(const Point& pivot, double degrees) = 0;
  virtual void PopRotation() = 0;

  virtual void DrawGrid(double grid_size) = 0;

  // --- Object bodies (unrotated frame) ---

  virtual void DrawShape(const SceneObject& obj, const ShapeBody& shape) = 0;

  /// draw_glyphs is false while an editing surface shows the text.
  virtual void DrawTextBox(const SceneObject& obj, const TextBody& text,
                           bool draw_glyphs) = 0;

  virtual void DrawPalette(const SceneObject& obj,
                           const PaletteBody& palette) = 0;

  // --- Chrome ---

  virtual void DrawSelectionBox(const Rect& bounds) = 0;
  virtual void DrawResizeHandle(const Point& center, double radius) = 0;

  /// anchor is the point on the object the handle stem connects to.
  virtual void DrawRotationHandle(const Point& center, const Point& anchor,
                                  double radius) = 0;

  virtual void DrawSnapGuide(const SnapGuide& guide) = 0;
  virtual void DrawBoxSelection(const Rect& rect) = 0;

 protected:
  RenderAdapter() = default;
};

/// Renderer painting into a caller-owned BGRA8 buffer, or nullptr when the
/// library was built without a raster back-end. The buffer must outlive the
/// returned adapter.
std::unique_ptr<RenderAdapter> CreateBufferRenderAdapter(uint8_t* pixels,
                                                         int width, int height,
                                                         int stride);

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_RENDER_RENDER_ADAPTER_H_
