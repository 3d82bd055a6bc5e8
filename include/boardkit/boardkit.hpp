// Copyright 2026 The boardkit Authors
//
// C++ RAII wrapper for the boardkit C API.
// Header-only; just include this file. Requires C++17 or later.
//
// Usage:
//   #include "boardkit/boardkit.hpp"
//   boardkit::Board board;
//   board.set_tool(kBoardKitToolShape);
//   board.pointer_down(100, 100);
//   board.pointer_move(220, 180);
//   board.pointer_up(220, 180);
//   printf("Objects: %d\n", board.object_count());

#ifndef BOARDKIT_BOARDKIT_HPP_
#define BOARDKIT_BOARDKIT_HPP_

#include "boardkit/boardkit.h"

#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace boardkit {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(BoardKitError code, const char* msg)
      : std::runtime_error(msg ? msg : "boardkit error"), code_(code) {}
  BoardKitError code() const noexcept { return code_; }

 private:
  BoardKitError code_;
};

// ---------------------------------------------------------------------------
// Board  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Board {
 public:
  Board() : raw_(boardkit_board_create()) {
    if (!raw_) throw Error(kBoardKitErrorOutOfMemory, "Board creation failed");
  }
  ~Board() { boardkit_board_destroy(raw_); }

  Board(Board&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Board& operator=(Board&& o) noexcept {
    if (this != &o) {
      boardkit_board_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Board(const Board&) = delete;
  Board& operator=(const Board&) = delete;

  BoardKitBoard* get() const noexcept { return raw_; }

  BoardKitError last_error() const { return boardkit_get_last_error(raw_); }
  const char* last_error_message() const {
    return boardkit_get_last_error_message(raw_);
  }

  void set_observer(const BoardKitObserver* observer) {
    boardkit_set_observer(raw_, observer);
  }

  // -- Tools --

  void set_tool(BoardKitTool tool, const BoardKitShapeStyle* style = nullptr) {
    check(boardkit_set_tool(raw_, tool, style));
  }
  BoardKitTool tool() const { return boardkit_get_tool(raw_); }

  // -- Viewport --

  void set_viewport(double zoom, double pan_x, double pan_y) {
    check(boardkit_set_viewport(raw_, zoom, pan_x, pan_y));
  }
  double zoom() const {
    double z = 1.0;
    boardkit_get_viewport(raw_, &z, nullptr, nullptr);
    return z;
  }
  void zoom_at(double screen_x, double screen_y, double factor) {
    check(boardkit_zoom_at(raw_, screen_x, screen_y, factor));
  }
  void pan_by(double dx, double dy) { check(boardkit_pan_by(raw_, dx, dy)); }

  /// Returns false when the board has nothing visible to fit.
  bool fit_to_content(int view_width, int view_height) {
    auto err = boardkit_fit_to_content(raw_, view_width, view_height);
    if (err == kBoardKitErrorInvalidState) return false;
    check(err);
    return true;
  }

  // -- Input (screen coordinates) --

  void pointer_down(double x, double y, int modifiers = kBoardKitModNone) {
    check(boardkit_pointer_down(raw_, x, y, modifiers));
  }
  void pointer_move(double x, double y) {
    check(boardkit_pointer_move(raw_, x, y));
  }
  void pointer_up(double x, double y) {
    check(boardkit_pointer_up(raw_, x, y));
  }
  void double_click(double x, double y) {
    check(boardkit_double_click(raw_, x, y));
  }
  bool key_down(BoardKitKey key, int modifiers = kBoardKitModNone) {
    return boardkit_key_down(raw_, key, modifiers) != 0;
  }
  BoardKitInteractionState state() const {
    return boardkit_get_interaction_state(raw_);
  }

  void box_select_begin(double x, double y) {
    check(boardkit_box_select_begin(raw_, x, y));
  }
  void box_select_update(double x, double y) {
    check(boardkit_box_select_update(raw_, x, y));
  }
  void box_select_end(int modifiers = kBoardKitModNone) {
    check(boardkit_box_select_end(raw_, modifiers));
  }

  // -- Selection --

  std::vector<std::string> selection() const {
    std::vector<std::string> ids;
    int count = boardkit_selection_count(raw_);
    char buf[64];
    for (int i = 0; i < count; ++i) {
      if (boardkit_selection_get_id(raw_, i, buf, sizeof(buf)) == kBoardKitOk)
        ids.emplace_back(buf);
    }
    return ids;
  }
  void select(const std::string& id, bool multi = false) {
    check(boardkit_select_object(raw_, id.c_str(), multi ? 1 : 0));
  }
  void select_all() { boardkit_select_all(raw_); }
  void clear_selection() { boardkit_clear_selection(raw_); }

  // -- Objects --

  int object_count() const { return boardkit_object_count(raw_); }

  /// Objects in z order (bottom first).
  std::vector<BoardKitObjectInfo> objects() const {
    std::vector<BoardKitObjectInfo> out;
    int count = boardkit_object_count(raw_);
    for (int i = 0; i < count; ++i) {
      BoardKitObjectInfo info = {};
      if (boardkit_object_get_info(raw_, i, &info) == kBoardKitOk)
        out.push_back(info);
    }
    return out;
  }

  std::optional<BoardKitObjectInfo> find(const std::string& id) const {
    BoardKitObjectInfo info = {};
    if (boardkit_object_find(raw_, id.c_str(), &info) != kBoardKitOk)
      return std::nullopt;
    return info;
  }

  /// Topmost visible object under a screen point, or "" for none.
  std::string hit_test(double x, double y) {
    char buf[64] = {};
    boardkit_hit_test(raw_, x, y, buf, sizeof(buf));
    return buf;
  }

  void delete_selected() { check(boardkit_delete_selected(raw_)); }
  void set_visible(const std::string& id, bool visible) {
    check(boardkit_object_set_visible(raw_, id.c_str(), visible ? 1 : 0));
  }
  void set_shape_style(const std::string& id, const BoardKitShapeStyle& style) {
    check(boardkit_object_set_shape_style(raw_, id.c_str(), &style));
  }
  void set_text_align(const std::string& id, BoardKitTextAlign align) {
    check(boardkit_object_set_text_align(raw_, id.c_str(), align));
  }
  void reset_rotation() { check(boardkit_reset_rotation(raw_)); }
  void bring_to_front(const std::string& id) {
    check(boardkit_bring_to_front(raw_, id.c_str()));
  }
  void send_to_back(const std::string& id) {
    check(boardkit_send_to_back(raw_, id.c_str()));
  }
  void move_layer(const std::string& id, int direction) {
    check(boardkit_move_layer(raw_, id.c_str(), direction));
  }

  std::string add_text(double x, double y) {
    char buf[64] = {};
    check(boardkit_add_text(raw_, x, y, buf, sizeof(buf)));
    return buf;
  }
  std::string add_color_palette(double x, double y, double cell_size,
                                int cols, int rows, bool wide_cell,
                                const std::vector<uint32_t>& colors) {
    char buf[64] = {};
    check(boardkit_add_color_palette(
        raw_, x, y, cell_size, cols, rows, wide_cell ? 1 : 0,
        colors.empty() ? nullptr : colors.data(),
        static_cast<int>(colors.size()), buf, sizeof(buf)));
    return buf;
  }

  // -- Inline text editing --

  void set_text_surface(const BoardKitTextSurfaceCallbacks* callbacks) {
    boardkit_set_text_surface(raw_, callbacks);
  }
  void text_edit_begin(const std::string& id) {
    check(boardkit_text_edit_begin(raw_, id.c_str()));
  }
  void text_edit_insert(const std::string& utf8) {
    check(boardkit_text_edit_insert(raw_, utf8.c_str()));
  }
  void text_edit_backspace() { check(boardkit_text_edit_backspace(raw_)); }
  void text_edit_set_caret(int offset) {
    check(boardkit_text_edit_set_caret(raw_, offset));
  }
  void text_edit_commit() { check(boardkit_text_edit_commit(raw_)); }

  std::string plain_text(const std::string& id) const {
    int len = boardkit_text_get_plain(raw_, id.c_str(), nullptr, 0);
    if (len < 0) throw Error(kBoardKitErrorNotFound, "No text object");
    std::vector<char> buf(static_cast<size_t>(len) + 1, '\0');
    boardkit_text_get_plain(raw_, id.c_str(), buf.data(),
                            static_cast<int>(buf.size()));
    return std::string(buf.data(), static_cast<size_t>(len));
  }

  // -- History --

  /// Returns false when there is nothing to undo.
  bool undo() {
    auto err = boardkit_undo(raw_);
    if (err == kBoardKitErrorHistoryEmpty) return false;
    check(err);
    return true;
  }
  bool redo() {
    auto err = boardkit_redo(raw_);
    if (err == kBoardKitErrorHistoryEmpty) return false;
    check(err);
    return true;
  }
  bool can_undo() const { return boardkit_can_undo(raw_) != 0; }
  bool can_redo() const { return boardkit_can_redo(raw_) != 0; }
  BoardKitHistoryStats history_stats() const {
    BoardKitHistoryStats s = {};
    boardkit_history_stats(raw_, &s);
    return s;
  }
  void clear_history() { boardkit_history_clear(raw_); }

  // -- Rendering --

  bool needs_redraw() { return boardkit_needs_redraw(raw_) != 0; }
  void render(uint8_t* bgra, int width, int height, int stride) {
    check(boardkit_render_to_buffer(raw_, bgra, width, height, stride));
  }

  // -- Settings --

  void load_settings(const char* path = nullptr) {
    check(boardkit_load_settings(raw_, path));
  }
  void save_settings(const char* path = nullptr) const {
    auto err = boardkit_save_settings(raw_, path);
    if (err != kBoardKitOk) throw Error(err, "Cannot write settings file");
  }
  void set_snapping(bool enabled, double threshold) {
    check(boardkit_set_snapping(raw_, enabled ? 1 : 0, threshold));
  }
  void set_max_history(int max_history) {
    check(boardkit_set_max_history(raw_, max_history));
  }

 private:
  void check(BoardKitError err) const {
    if (err != kBoardKitOk)
      throw Error(err, boardkit_get_last_error_message(raw_));
  }

  BoardKitBoard* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Free functions (color utilities)
// ---------------------------------------------------------------------------

inline std::string to_hex(uint32_t argb, bool alpha = false) {
  char buf[16] = {};
  boardkit_color_to_hex(argb, buf, sizeof(buf), alpha ? 1 : 0);
  return buf;
}

inline uint32_t from_hex(const char* hex) {
  uint32_t argb = 0;
  auto err = boardkit_color_from_hex(hex, &argb);
  if (err != kBoardKitOk) throw Error(err, "Invalid hex color");
  return argb;
}

inline BoardKitShapeStyle default_shape_style() {
  BoardKitShapeStyle style = {};
  boardkit_default_shape_style(&style);
  return style;
}

inline const char* version_string() { return boardkit_version_string(); }

}  // namespace boardkit

#endif  // BOARDKIT_BOARDKIT_HPP_
