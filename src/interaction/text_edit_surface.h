// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_INTERACTION_TEXT_EDIT_SURFACE_H_
#define BOARDKIT_INTERACTION_TEXT_EDIT_SURFACE_H_

#include <functional>
#include <vector>

#include "scene/scene_object.h"

namespace boardkit {
namespace internal {

/// Screen-space placement of the editing surface.
struct SurfaceRect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
  double scale = 1.0;  // Current zoom.
};

/// Editable overlay for inline rich-text editing. The surface owns the
/// visible glyphs while open; the board draws only the text box.
class TextEditSurface {
 public:
  /// Receives the full run array after every edit.
  using ContentCallback = std::function<void(std::vector<TextRun> runs)>;

  virtual ~TextEditSurface() = default;

  /// Open over a text object. on_edit must be called with a valid run
  /// array after each change.
  virtual void Open(const SceneObject& object, const SurfaceRect& rect,
                    ContentCallback on_edit) = 0;

  /// Follow a pan/zoom change without losing the edit or the caret.
  virtual void Reposition(const SurfaceRect& rect) = 0;

  /// Content at the moment of the call.
  virtual std::vector<TextRun> Content() const = 0;

  virtual void Close() = 0;
  virtual bool is_open() const = 0;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_INTERACTION_TEXT_EDIT_SURFACE_H_
