// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_INTERACTION_BUFFER_TEXT_SURFACE_H_
#define BOARDKIT_INTERACTION_BUFFER_TEXT_SURFACE_H_

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "interaction/text_edit_surface.h"

namespace boardkit {
namespace internal {

/// In-memory editing surface driven through the C API (insert, backspace,
/// caret moves). Placement changes are forwarded to optional host hooks so
/// a native widget can follow the text box.
class BufferTextSurface : public TextEditSurface {
 public:
  struct Placement {
    std::function<void(const std::string& id, const SurfaceRect& rect)> open;
    std::function<void(const SurfaceRect& rect)> reposition;
    std::function<void()> close;
  };

  BufferTextSurface() = default;

  // Non-copyable.
  BufferTextSurface(const BufferTextSurface&) = delete;
  BufferTextSurface& operator=(const BufferTextSurface&) = delete;

  void SetPlacement(Placement placement) { placement_ = std::move(placement); }

  // TextEditSurface:
  void Open(const SceneObject& object, const SurfaceRect& rect,
            ContentCallback on_edit) override;
  void Reposition(const SurfaceRect& rect) override;
  std::vector<TextRun> Content() const override { return runs_; }
  void Close() override;
  bool is_open() const override { return open_; }

  // -- Editing --

  /// Insert UTF-8 text at the caret using the typing style.
  bool Insert(const std::string& utf8);

  /// Delete the code point before the caret.
  bool Backspace();

  /// Move the caret (clamped to the text length).
  void SetCaret(size_t offset);
  size_t caret() const { return caret_; }

  void SetTypingStyle(const TextStyle& style) { typing_style_ = style; }
  const TextStyle& typing_style() const { return typing_style_; }

  const SurfaceRect& rect() const { return rect_; }
  const std::string& object_id() const { return object_id_; }

 private:
  void Publish();

  bool open_ = false;
  std::string object_id_;
  std::vector<TextRun> runs_;
  size_t caret_ = 0;
  TextStyle typing_style_;
  SurfaceRect rect_;
  ContentCallback on_edit_;
  Placement placement_;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_INTERACTION_BUFFER_TEXT_SURFACE_H_
