// Copyright 2026 The boardkit Authors
//
// This file implements all public C API functions declared in boardkit.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "boardkit/boardkit.h"

#include <new>
#include <string>
#include <utility>
#include <vector>

#include <cstring>

#include "core/board_context.h"
#include "core/callback_sink.h"
#include "core/color_utils.h"
#include "core/logger.h"
#include "scene/rich_text.h"

using boardkit::internal::BoardContextImpl;
using boardkit::internal::InteractionState;
using boardkit::internal::Key;
using boardkit::internal::Modifiers;
using boardkit::internal::PaletteBody;
using boardkit::internal::Point;
using boardkit::internal::SceneObject;
using boardkit::internal::ShapeBody;
using boardkit::internal::ShapeToolStyle;
using boardkit::internal::ShapeType;
using boardkit::internal::TextAlign;
using boardkit::internal::Tool;

// ---------------------------------------------------------------------------
// The opaque BoardKitBoard struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct BoardKitBoard {
  BoardContextImpl impl;
};

// Convert the public modifier bit set.
static Modifiers ToModifiers(int bits) {
  Modifiers mods;
  mods.shift = (bits & kBoardKitModShift) != 0;
  mods.ctrl = (bits & kBoardKitModCtrl) != 0;
  mods.meta = (bits & kBoardKitModMeta) != 0;
  mods.alt = (bits & kBoardKitModAlt) != 0;
  return mods;
}

static bool IsValidShapeType(int type) {
  return type >= kBoardKitShapeSquare && type <= kBoardKitShapePolygon;
}

static ShapeToolStyle ToInternal(const BoardKitShapeStyle& s) {
  ShapeToolStyle out;
  out.type = static_cast<ShapeType>(s.type);
  out.fill_color = s.fill_color;
  out.has_stroke = s.has_stroke != 0;
  out.stroke_color = s.stroke_color;
  out.stroke_width = s.stroke_width;
  return out;
}

// Copy a string into a caller buffer, truncating if needed.
static void CopyOut(const std::string& value, char* buf, int buf_size) {
  if (!buf || buf_size <= 0) return;
  size_t n = value.size();
  if (n >= static_cast<size_t>(buf_size)) n = static_cast<size_t>(buf_size) - 1;
  std::memcpy(buf, value.data(), n);
  buf[n] = '\0';
}

static void FillInfo(const SceneObject& obj, BoardKitObjectInfo* out) {
  std::memset(out, 0, sizeof(*out));
  CopyOut(obj.id, out->id, static_cast<int>(sizeof(out->id)));
  out->kind = static_cast<BoardKitObjectKind>(obj.kind());
  out->x = obj.x;
  out->y = obj.y;
  out->width = obj.width;
  out->height = obj.height;
  out->rotation = obj.rotation;
  out->z_index = obj.z_index;
  out->visible = obj.visible ? 1 : 0;
  if (const ShapeBody* shape = obj.shape()) {
    out->shape_type = static_cast<BoardKitShapeType>(shape->shape_type);
    out->x2 = shape->x2;
    out->y2 = shape->y2;
  }
  if (obj.text()) out->is_editing = obj.text()->is_editing ? 1 : 0;
}

// Reject NULL ids and ids of objects that do not exist.
static bool RequireObject(BoardKitBoard* board, const char* id) {
  if (!id) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "id is NULL");
    return false;
  }
  if (!board->impl.scene().Contains(id)) {
    board->impl.SetError(kBoardKitErrorNotFound,
                         std::string("No object with id ") + id);
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Board management
// ---------------------------------------------------------------------------

BoardKitBoard* boardkit_board_create(void) {
  return new (std::nothrow) BoardKitBoard();
}

void boardkit_board_destroy(BoardKitBoard* board) {
  delete board;
}

void boardkit_set_observer(BoardKitBoard* board,
                           const BoardKitObserver* observer) {
  if (!board) return;
  board->impl.SetObserver(observer);
}

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

BoardKitError boardkit_get_last_error(const BoardKitBoard* board) {
  if (!board) return kBoardKitErrorInvalidParam;
  return board->impl.last_error();
}

const char* boardkit_get_last_error_message(const BoardKitBoard* board) {
  if (!board) return "Invalid board (NULL)";
  return board->impl.last_error_message();
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------

BoardKitError boardkit_set_tool(BoardKitBoard* board, BoardKitTool tool,
                                const BoardKitShapeStyle* style) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (tool < kBoardKitToolNone || tool > kBoardKitToolShape) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "Unknown tool");
    return kBoardKitErrorInvalidParam;
  }
  if (style && !IsValidShapeType(style->type)) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "Unknown shape type");
    return kBoardKitErrorInvalidParam;
  }
  if (style) {
    ShapeToolStyle s = ToInternal(*style);
    board->impl.controller().SetTool(static_cast<Tool>(tool), &s);
  } else {
    board->impl.controller().SetTool(static_cast<Tool>(tool));
  }
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitTool boardkit_get_tool(const BoardKitBoard* board) {
  if (!board) return kBoardKitToolNone;
  return static_cast<BoardKitTool>(board->impl.controller().tool());
}

void boardkit_default_shape_style(BoardKitShapeStyle* out_style) {
  if (!out_style) return;
  ShapeToolStyle defaults;
  out_style->type = static_cast<BoardKitShapeType>(defaults.type);
  out_style->fill_color = defaults.fill_color;
  out_style->has_stroke = defaults.has_stroke ? 1 : 0;
  out_style->stroke_color = defaults.stroke_color;
  out_style->stroke_width = static_cast<float>(defaults.stroke_width);
}

// ---------------------------------------------------------------------------
// Viewport
// ---------------------------------------------------------------------------

BoardKitError boardkit_set_viewport(BoardKitBoard* board, double zoom,
                                    double pan_x, double pan_y) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!(zoom > 0)) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "zoom must be positive");
    return kBoardKitErrorInvalidParam;
  }
  board->impl.SetViewport(zoom, pan_x, pan_y);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_get_viewport(const BoardKitBoard* board,
                                    double* out_zoom, double* out_pan_x,
                                    double* out_pan_y) {
  if (!board) return kBoardKitErrorInvalidParam;
  const auto& viewport = board->impl.viewport();
  if (out_zoom) *out_zoom = viewport.zoom();
  if (out_pan_x) *out_pan_x = viewport.pan_x();
  if (out_pan_y) *out_pan_y = viewport.pan_y();
  return kBoardKitOk;
}

BoardKitError boardkit_zoom_at(BoardKitBoard* board, double screen_x,
                               double screen_y, double factor) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!(factor > 0)) {
    board->impl.SetError(kBoardKitErrorInvalidParam,
                         "zoom factor must be positive");
    return kBoardKitErrorInvalidParam;
  }
  board->impl.ZoomAt(screen_x, screen_y, factor);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_pan_by(BoardKitBoard* board, double dx, double dy) {
  if (!board) return kBoardKitErrorInvalidParam;
  board->impl.PanBy(dx, dy);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_fit_to_content(BoardKitBoard* board, int view_width,
                                      int view_height) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (view_width <= 0 || view_height <= 0) {
    board->impl.SetError(kBoardKitErrorInvalidParam,
                         "View size must be positive");
    return kBoardKitErrorInvalidParam;
  }
  if (!board->impl.FitToContent(view_width, view_height)) {
    board->impl.SetError(kBoardKitErrorInvalidState,
                         "Board has no visible content");
    return kBoardKitErrorInvalidState;
  }
  board->impl.ClearError();
  return kBoardKitOk;
}

// ---------------------------------------------------------------------------
// Input events
// ---------------------------------------------------------------------------

BoardKitError boardkit_pointer_down(BoardKitBoard* board, double screen_x,
                                    double screen_y, int modifiers) {
  if (!board) return kBoardKitErrorInvalidParam;
  Point p = board->impl.ToWorld(screen_x, screen_y);
  board->impl.controller().PointerDown(p.x, p.y, ToModifiers(modifiers));
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_pointer_move(BoardKitBoard* board, double screen_x,
                                    double screen_y) {
  if (!board) return kBoardKitErrorInvalidParam;
  Point p = board->impl.ToWorld(screen_x, screen_y);
  board->impl.controller().PointerMove(p.x, p.y, Modifiers());
  return kBoardKitOk;
}

BoardKitError boardkit_pointer_up(BoardKitBoard* board, double screen_x,
                                  double screen_y) {
  if (!board) return kBoardKitErrorInvalidParam;
  Point p = board->impl.ToWorld(screen_x, screen_y);
  board->impl.controller().PointerUp(p.x, p.y, Modifiers());
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_double_click(BoardKitBoard* board, double screen_x,
                                    double screen_y) {
  if (!board) return kBoardKitErrorInvalidParam;
  Point p = board->impl.ToWorld(screen_x, screen_y);
  board->impl.controller().DoubleClick(p.x, p.y);
  board->impl.ClearError();
  return kBoardKitOk;
}

int boardkit_key_down(BoardKitBoard* board, BoardKitKey key, int modifiers) {
  if (!board) return 0;
  Key internal_key = Key::kOther;
  switch (key) {
    case kBoardKitKeyDelete:
      internal_key = Key::kDelete;
      break;
    case kBoardKitKeyBackspace:
      internal_key = Key::kBackspace;
      break;
    case kBoardKitKeyEscape:
      internal_key = Key::kEscape;
      break;
    case kBoardKitKeyR:
      internal_key = Key::kR;
      break;
    case kBoardKitKeyZ:
      internal_key = Key::kZ;
      break;
    case kBoardKitKeyY:
      internal_key = Key::kY;
      break;
    default:
      break;
  }
  return board->impl.controller().HandleKey(internal_key,
                                            ToModifiers(modifiers))
             ? 1
             : 0;
}

BoardKitInteractionState boardkit_get_interaction_state(
    const BoardKitBoard* board) {
  if (!board) return kBoardKitStateIdle;
  return static_cast<BoardKitInteractionState>(
      board->impl.controller().state());
}

BoardKitError boardkit_box_select_begin(BoardKitBoard* board, double screen_x,
                                        double screen_y) {
  if (!board) return kBoardKitErrorInvalidParam;
  Point p = board->impl.ToWorld(screen_x, screen_y);
  if (!board->impl.controller().BeginBoxSelection(p.x, p.y)) {
    board->impl.SetError(kBoardKitErrorInvalidState,
                         "Another gesture is in progress");
    return kBoardKitErrorInvalidState;
  }
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_box_select_update(BoardKitBoard* board,
                                         double screen_x, double screen_y) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (board->impl.controller().state() != InteractionState::kBoxSelecting) {
    board->impl.SetError(kBoardKitErrorInvalidState,
                         "No box selection in progress");
    return kBoardKitErrorInvalidState;
  }
  Point p = board->impl.ToWorld(screen_x, screen_y);
  board->impl.controller().UpdateBoxSelection(p.x, p.y);
  return kBoardKitOk;
}

BoardKitError boardkit_box_select_end(BoardKitBoard* board, int modifiers) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (board->impl.controller().state() != InteractionState::kBoxSelecting) {
    board->impl.SetError(kBoardKitErrorInvalidState,
                         "No box selection in progress");
    return kBoardKitErrorInvalidState;
  }
  board->impl.controller().EndBoxSelection(ToModifiers(modifiers));
  board->impl.ClearError();
  return kBoardKitOk;
}

// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------

int boardkit_selection_count(const BoardKitBoard* board) {
  if (!board) return 0;
  return static_cast<int>(board->impl.selection().size());
}

BoardKitError boardkit_selection_get_id(const BoardKitBoard* board, int index,
                                        char* buf, int buf_size) {
  if (!board || !buf || buf_size <= 0) return kBoardKitErrorInvalidParam;
  const auto& ids = board->impl.selection().ids();
  if (index < 0 || index >= static_cast<int>(ids.size())) {
    return kBoardKitErrorInvalidParam;
  }
  CopyOut(ids[index], buf, buf_size);
  return kBoardKitOk;
}

BoardKitError boardkit_selection_get_primary(const BoardKitBoard* board,
                                             char* buf, int buf_size) {
  if (!board || !buf || buf_size <= 0) return kBoardKitErrorInvalidParam;
  const std::string* primary = board->impl.selection().primary();
  CopyOut(primary ? *primary : std::string(), buf, buf_size);
  return kBoardKitOk;
}

BoardKitError boardkit_select_object(BoardKitBoard* board, const char* id,
                                     int multi) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!RequireObject(board, id)) return board->impl.last_error();
  board->impl.controller().SelectObject(id, multi != 0);
  board->impl.ClearError();
  return kBoardKitOk;
}

void boardkit_select_all(BoardKitBoard* board) {
  if (!board) return;
  board->impl.controller().SelectAll();
}

void boardkit_clear_selection(BoardKitBoard* board) {
  if (!board) return;
  board->impl.controller().ClearSelection();
}

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

int boardkit_object_count(const BoardKitBoard* board) {
  if (!board) return 0;
  return static_cast<int>(board->impl.scene().size());
}

BoardKitError boardkit_object_get_info(const BoardKitBoard* board, int index,
                                       BoardKitObjectInfo* out) {
  if (!board || !out) return kBoardKitErrorInvalidParam;
  auto ordered = board->impl.scene().ObjectsByZOrder();
  if (index < 0 || index >= static_cast<int>(ordered.size())) {
    return kBoardKitErrorInvalidParam;
  }
  FillInfo(*ordered[index], out);
  return kBoardKitOk;
}

BoardKitError boardkit_object_find(const BoardKitBoard* board, const char* id,
                                   BoardKitObjectInfo* out) {
  if (!board || !id || !out) return kBoardKitErrorInvalidParam;
  const SceneObject* obj = board->impl.scene().Find(id);
  if (!obj) return kBoardKitErrorNotFound;
  FillInfo(*obj, out);
  return kBoardKitOk;
}

BoardKitError boardkit_hit_test(BoardKitBoard* board, double screen_x,
                                double screen_y, char* buf, int buf_size) {
  if (!board || !buf || buf_size <= 0) return kBoardKitErrorInvalidParam;
  Point p = board->impl.ToWorld(screen_x, screen_y);
  const SceneObject* hit = board->impl.scene().FindAtPoint(p.x, p.y);
  if (!hit) {
    buf[0] = '\0';
    return kBoardKitErrorNotFound;
  }
  CopyOut(hit->id, buf, buf_size);
  return kBoardKitOk;
}

BoardKitError boardkit_delete_selected(BoardKitBoard* board) {
  if (!board) return kBoardKitErrorInvalidParam;
  board->impl.controller().DeleteSelected();
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_object_set_visible(BoardKitBoard* board,
                                          const char* id, int visible) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!RequireObject(board, id)) return board->impl.last_error();
  board->impl.controller().SetVisibility(id, visible != 0);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_object_set_shape_style(BoardKitBoard* board,
                                              const char* id,
                                              const BoardKitShapeStyle* style) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!style || !IsValidShapeType(style->type)) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "Invalid shape style");
    return kBoardKitErrorInvalidParam;
  }
  if (!RequireObject(board, id)) return board->impl.last_error();
  if (!board->impl.scene().Find(id)->shape()) {
    board->impl.SetError(kBoardKitErrorInvalidParam,
                         "Object is not a shape");
    return kBoardKitErrorInvalidParam;
  }

  const BoardKitShapeStyle s = *style;
  board->impl.controller().UpdateObject(id, [s](SceneObject* obj) {
    ShapeBody* shape = obj->shape();
    // Switching between box and segment geometry is not a style change.
    if (boardkit::internal::IsSegmentShape(shape->shape_type) ==
        boardkit::internal::IsSegmentShape(static_cast<ShapeType>(s.type))) {
      shape->shape_type = static_cast<ShapeType>(s.type);
    }
    shape->fill_color = s.fill_color;
    shape->has_stroke = s.has_stroke != 0;
    shape->stroke_color = s.stroke_color;
    shape->stroke_width = s.stroke_width;
  });
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_object_set_text_align(BoardKitBoard* board,
                                             const char* id,
                                             BoardKitTextAlign align) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (align < kBoardKitAlignLeft || align > kBoardKitAlignRight) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "Unknown text alignment");
    return kBoardKitErrorInvalidParam;
  }
  if (!RequireObject(board, id)) return board->impl.last_error();
  if (!board->impl.scene().Find(id)->text()) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "Object is not text");
    return kBoardKitErrorInvalidParam;
  }
  board->impl.controller().UpdateObject(id, [align](SceneObject* obj) {
    obj->text()->text_align = static_cast<TextAlign>(align);
  });
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_reset_rotation(BoardKitBoard* board) {
  if (!board) return kBoardKitErrorInvalidParam;
  board->impl.controller().ResetRotation();
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_bring_to_front(BoardKitBoard* board, const char* id) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!RequireObject(board, id)) return board->impl.last_error();
  board->impl.controller().BringToFront(id);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_send_to_back(BoardKitBoard* board, const char* id) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!RequireObject(board, id)) return board->impl.last_error();
  board->impl.controller().SendToBack(id);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_move_layer(BoardKitBoard* board, const char* id,
                                  int direction) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!RequireObject(board, id)) return board->impl.last_error();
  board->impl.controller().MoveLayer(id, direction);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_add_text(BoardKitBoard* board, double x, double y,
                                char* out_id, int out_id_size) {
  if (!board) return kBoardKitErrorInvalidParam;
  std::string id = board->impl.controller().AddText(x, y);
  CopyOut(id, out_id, out_id_size);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_add_color_palette(BoardKitBoard* board, double x,
                                         double y, double cell_size, int cols,
                                         int rows, int has_wide_cell,
                                         const uint32_t* colors,
                                         int color_count, char* out_id,
                                         int out_id_size) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (cols < 1 || rows < 1 || !(cell_size > 0) || color_count < 0 ||
      (color_count > 0 && !colors)) {
    board->impl.SetError(kBoardKitErrorInvalidParam,
                         "Invalid palette geometry or colors");
    return kBoardKitErrorInvalidParam;
  }
  PaletteBody palette;
  palette.cell_size = cell_size;
  palette.grid_cols = cols;
  palette.grid_rows = rows;
  palette.has_wide_cell = has_wide_cell != 0;
  if (color_count > 0) palette.colors.assign(colors, colors + color_count);

  std::string id = board->impl.controller().AddColorPalette(x, y, palette);
  if (id.empty()) {
    board->impl.SetError(kBoardKitErrorUnknown, "Palette was not created");
    return kBoardKitErrorUnknown;
  }
  CopyOut(id, out_id, out_id_size);
  board->impl.ClearError();
  return kBoardKitOk;
}

// ---------------------------------------------------------------------------
// Inline text editing
// ---------------------------------------------------------------------------

void boardkit_set_text_surface(BoardKitBoard* board,
                               const BoardKitTextSurfaceCallbacks* callbacks) {
  if (!board) return;
  board->impl.SetTextSurfaceCallbacks(callbacks);
}

BoardKitError boardkit_text_edit_begin(BoardKitBoard* board, const char* id) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!RequireObject(board, id)) return board->impl.last_error();
  if (!board->impl.controller().StartTextEdit(id)) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "Object is not text");
    return kBoardKitErrorInvalidParam;
  }
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_text_edit_insert(BoardKitBoard* board,
                                        const char* utf8) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!utf8) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "text is NULL");
    return kBoardKitErrorInvalidParam;
  }
  if (!board->impl.text_surface().is_open()) {
    board->impl.SetError(kBoardKitErrorInvalidState, "No text edit open");
    return kBoardKitErrorInvalidState;
  }
  board->impl.text_surface().Insert(utf8);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_text_edit_backspace(BoardKitBoard* board) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!board->impl.text_surface().is_open()) {
    board->impl.SetError(kBoardKitErrorInvalidState, "No text edit open");
    return kBoardKitErrorInvalidState;
  }
  board->impl.text_surface().Backspace();
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_text_edit_set_caret(BoardKitBoard* board, int offset) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (offset < 0) {
    board->impl.SetError(kBoardKitErrorInvalidParam, "Negative caret offset");
    return kBoardKitErrorInvalidParam;
  }
  if (!board->impl.text_surface().is_open()) {
    board->impl.SetError(kBoardKitErrorInvalidState, "No text edit open");
    return kBoardKitErrorInvalidState;
  }
  board->impl.text_surface().SetCaret(static_cast<size_t>(offset));
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_text_edit_commit(BoardKitBoard* board) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!board->impl.controller().is_editing_text()) {
    board->impl.SetError(kBoardKitErrorInvalidState, "No text edit open");
    return kBoardKitErrorInvalidState;
  }
  board->impl.controller().CommitTextEdit();
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_text_edit_get_id(const BoardKitBoard* board, char* buf,
                                        int buf_size) {
  if (!board || !buf || buf_size <= 0) return kBoardKitErrorInvalidParam;
  CopyOut(board->impl.controller().editing_id(), buf, buf_size);
  return kBoardKitOk;
}

int boardkit_text_get_plain(const BoardKitBoard* board, const char* id,
                            char* buf, int buf_size) {
  if (!board || !id) return -1;
  const SceneObject* obj = board->impl.scene().Find(id);
  if (!obj || !obj->text()) return -1;
  std::string plain = boardkit::internal::PlainText(obj->text()->content);
  CopyOut(plain, buf, buf_size);
  return static_cast<int>(plain.size());
}

int boardkit_text_run_count(const BoardKitBoard* board, const char* id) {
  if (!board || !id) return -1;
  const SceneObject* obj = board->impl.scene().Find(id);
  if (!obj || !obj->text()) return -1;
  return static_cast<int>(obj->text()->content.size());
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

BoardKitError boardkit_undo(BoardKitBoard* board) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!board->impl.controller().Undo()) {
    board->impl.SetError(kBoardKitErrorHistoryEmpty, "Nothing to undo");
    return kBoardKitErrorHistoryEmpty;
  }
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_redo(BoardKitBoard* board) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!board->impl.controller().Redo()) {
    board->impl.SetError(kBoardKitErrorHistoryEmpty, "Nothing to redo");
    return kBoardKitErrorHistoryEmpty;
  }
  board->impl.ClearError();
  return kBoardKitOk;
}

int boardkit_can_undo(const BoardKitBoard* board) {
  if (!board) return 0;
  return board->impl.history().CanUndo() ? 1 : 0;
}

int boardkit_can_redo(const BoardKitBoard* board) {
  if (!board) return 0;
  return board->impl.history().CanRedo() ? 1 : 0;
}

BoardKitError boardkit_history_stats(const BoardKitBoard* board,
                                     BoardKitHistoryStats* out) {
  if (!board || !out) return kBoardKitErrorInvalidParam;
  boardkit::internal::HistoryStats stats = board->impl.history().Stats();
  out->undo_count = stats.undo_count;
  out->redo_count = stats.redo_count;
  out->max_history = stats.max_history;
  return kBoardKitOk;
}

void boardkit_history_clear(BoardKitBoard* board) {
  if (!board) return;
  board->impl.history().Clear();
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

int boardkit_needs_redraw(BoardKitBoard* board) {
  if (!board) return 0;
  return board->impl.scene().ConsumeRedraw() ? 1 : 0;
}

BoardKitError boardkit_render_to_buffer(BoardKitBoard* board, uint8_t* bgra,
                                        int width, int height, int stride) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!bgra || width <= 0 || height <= 0 || stride < width * 4) {
    board->impl.SetError(kBoardKitErrorInvalidParam,
                         "Invalid render target buffer");
    return kBoardKitErrorInvalidParam;
  }
  return board->impl.RenderToBuffer(bgra, width, height, stride);
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

BoardKitError boardkit_load_settings(BoardKitBoard* board, const char* path) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!board->impl.LoadSettings(path ? path : "")) {
    board->impl.SetError(kBoardKitErrorConfigFailed,
                         "Cannot read settings file");
    return kBoardKitErrorConfigFailed;
  }
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_save_settings(const BoardKitBoard* board,
                                     const char* path) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (!board->impl.SaveSettings(path ? path : "")) {
    return kBoardKitErrorConfigFailed;
  }
  return kBoardKitOk;
}

BoardKitError boardkit_set_snapping(BoardKitBoard* board, int enabled,
                                    double threshold) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (threshold < 0) {
    board->impl.SetError(kBoardKitErrorInvalidParam,
                         "Snap threshold must not be negative");
    return kBoardKitErrorInvalidParam;
  }
  board->impl.SetSnapping(enabled != 0, threshold);
  board->impl.ClearError();
  return kBoardKitOk;
}

BoardKitError boardkit_set_max_history(BoardKitBoard* board,
                                       int max_history) {
  if (!board) return kBoardKitErrorInvalidParam;
  if (max_history < 1) {
    board->impl.SetError(kBoardKitErrorInvalidParam,
                         "max_history must be at least 1");
    return kBoardKitErrorInvalidParam;
  }
  board->impl.SetMaxHistory(max_history);
  board->impl.ClearError();
  return kBoardKitOk;
}

// ---------------------------------------------------------------------------
// Color utilities
// ---------------------------------------------------------------------------

void boardkit_color_to_hex(uint32_t argb, char* buf, int buf_size,
                           int include_alpha) {
  if (!buf || buf_size <= 0) return;
  boardkit::internal::ColorToHex(argb, buf, buf_size, include_alpha != 0);
}

BoardKitError boardkit_color_from_hex(const char* hex, uint32_t* out_argb) {
  if (!hex || !out_argb) return kBoardKitErrorInvalidParam;
  if (boardkit::internal::ColorFromHex(hex, out_argb)) {
    return kBoardKitOk;
  }
  return kBoardKitErrorInvalidParam;
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* boardkit_version_string(void) {
  return BOARDKIT_VERSION_STRING;
}

int boardkit_version_major(void) { return BOARDKIT_VERSION_MAJOR; }
int boardkit_version_minor(void) { return BOARDKIT_VERSION_MINOR; }
int boardkit_version_patch(void) { return BOARDKIT_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void boardkit_set_log_level(BoardKitLogLevel level) {
  boardkit::internal::SetLogLevel(level);
}

void boardkit_set_log_callback(boardkit_log_callback_t callback,
                               void* userdata) {
  auto sink = boardkit::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void boardkit_log(BoardKitLogLevel level, const char* message) {
  if (!message) return;
  auto logger = boardkit::internal::GetLogger();
  if (logger) {
    logger->log(boardkit::internal::ToSpdlogLevel(level), "{}", message);
  }
}
