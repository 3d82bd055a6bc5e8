// Copyright 2026 The boardkit Authors

#include "interaction/buffer_text_surface.h"

#include <algorithm>
#include <utility>

#include "scene/rich_text.h"

namespace boardkit {
namespace internal {

void BufferTextSurface::Open(const SceneObject& object, const SurfaceRect& rect,
                             ContentCallback on_edit) {
  const TextBody* text = object.text();
  object_id_ = object.id;
  runs_ = text ? text->content : std::vector<TextRun>();
  caret_ = TextLength(runs_);
  typing_style_ = text ? StyleAt(runs_, caret_, text->default_style)
                       : TextStyle();
  rect_ = rect;
  on_edit_ = std::move(on_edit);
  open_ = true;
  if (placement_.open) placement_.open(object_id_, rect_);
}

void BufferTextSurface::Reposition(const SurfaceRect& rect) {
  if (!open_) return;
  rect_ = rect;
  if (placement_.reposition) placement_.reposition(rect_);
}

void BufferTextSurface::Close() {
  if (!open_) return;
  open_ = false;
  on_edit_ = nullptr;
  object_id_.clear();
  if (placement_.close) placement_.close();
}

bool BufferTextSurface::Insert(const std::string& utf8) {
  if (!open_ || utf8.empty()) return false;
  runs_ = InsertText(runs_, caret_, utf8, typing_style_);
  caret_ = (std::min)(caret_ + utf8.size(), TextLength(runs_));
  Publish();
  return true;
}

bool BufferTextSurface::Backspace() {
  if (!open_ || caret_ == 0) return false;
  std::string text = PlainText(runs_);
  size_t begin = caret_ - 1;
  while (begin > 0 && (static_cast<unsigned char>(text[begin]) & 0xC0) == 0x80)
    --begin;
  runs_ = EraseText(runs_, begin, caret_);
  caret_ = begin;
  Publish();
  return true;
}

void BufferTextSurface::SetCaret(size_t offset) {
  caret_ = (std::min)(offset, TextLength(runs_));
}

void BufferTextSurface::Publish() {
  if (on_edit_) on_edit_(runs_);
}

}  // namespace internal
}  // namespace boardkit
