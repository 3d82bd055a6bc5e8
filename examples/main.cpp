// Copyright 2026 The boardkit Authors
//
// boardkit demo -- drives a board headlessly through the C++ wrapper:
// draws a few objects, edits text inline, moves things around, walks the
// undo history and renders a frame to a PPM file when a renderer is built in.
//
// Usage: boardkit_demo [output.ppm]

#include <cstdio>
#include <string>
#include <vector>

#include "boardkit/boardkit.hpp"

namespace {

const char* KindName(BoardKitObjectKind kind) {
  switch (kind) {
    case kBoardKitObjectShape:
      return "shape";
    case kBoardKitObjectText:
      return "text";
    case kBoardKitObjectColorPalette:
      return "palette";
  }
  return "?";
}

void PrintBoard(const boardkit::Board& board, const char* title) {
  std::printf("-- %s (%d objects) --\n", title, board.object_count());
  for (const auto& info : board.objects()) {
    std::printf("  z=%-3d %-8s %-24s (%.0f, %.0f) %.0fx%.0f rot=%.0f%s\n",
                info.z_index, KindName(info.kind), info.id, info.x, info.y,
                info.width, info.height, info.rotation,
                info.visible ? "" : " [hidden]");
  }
  auto stats = board.history_stats();
  std::printf("  history: %d undo / %d redo (max %d)\n", stats.undo_count,
              stats.redo_count, stats.max_history);
}

void OnLog(BoardKitLogLevel /*level*/, const char* message,
           void* /*userdata*/) {
  std::printf("[log] %s\n", message);
}

void OnToolChanged(BoardKitTool tool, void* /*userdata*/) {
  std::printf("[observer] tool changed -> %d\n", static_cast<int>(tool));
}

void Drag(boardkit::Board& board, double x0, double y0, double x1, double y1,
          int modifiers = kBoardKitModNone) {
  board.pointer_down(x0, y0, modifiers);
  board.pointer_move((x0 + x1) / 2, (y0 + y1) / 2);
  board.pointer_move(x1, y1);
  board.pointer_up(x1, y1);
}

bool WritePpm(const char* path, const std::vector<uint8_t>& bgra, int width,
              int height) {
  FILE* f = std::fopen(path, "wb");
  if (!f) return false;
  std::fprintf(f, "P6\n%d %d\n255\n", width, height);
  for (int i = 0; i < width * height; ++i) {
    const uint8_t rgb[3] = {bgra[i * 4 + 2], bgra[i * 4 + 1], bgra[i * 4]};
    std::fwrite(rgb, 1, 3, f);
  }
  std::fclose(f);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  std::printf("boardkit %s\n", boardkit::version_string());
  boardkit_set_log_callback(OnLog, nullptr);
  boardkit_set_log_level(kBoardKitLogInfo);

  try {
    boardkit::Board board;

    BoardKitObserver observer = {};
    observer.tool_changed = OnToolChanged;
    board.set_observer(&observer);

    // Two rectangles and an arrow with the shape tool.
    auto style = boardkit::default_shape_style();
    style.type = kBoardKitShapeRectangle;
    board.set_tool(kBoardKitToolShape, &style);
    Drag(board, 100, 100, 260, 200);

    style.type = kBoardKitShapeCircle;
    style.fill_color = boardkit::from_hex("#F59E0B");
    board.set_tool(kBoardKitToolShape, &style);
    Drag(board, 400, 120, 520, 240);

    style.type = kBoardKitShapeArrow;
    style.stroke_color = boardkit::from_hex("#111827");
    board.set_tool(kBoardKitToolShape, &style);
    Drag(board, 270, 150, 390, 180);

    // A text box, edited inline.
    std::string text_id = board.add_text(100, 300);
    board.text_edit_begin(text_id);
    board.text_edit_set_caret(0);
    board.text_edit_insert("Hello, ");
    board.text_edit_commit();
    std::printf("text: \"%s\"\n", board.plain_text(text_id).c_str());

    // A 4x2 palette with a wide cell.
    std::vector<uint32_t> colors = {0xFFEF4444, 0xFFF59E0B, 0xFF10B981,
                                    0xFF3B82F6, 0xFF8B5CF6, 0xFFEC4899,
                                    0xFF6B7280, 0xFF111827, 0xFFFFFFFF};
    board.add_color_palette(600, 100, 40, 4, 2, true, colors);
    PrintBoard(board, "created");

    // Move the first rectangle right, then rotate and reset it.
    Drag(board, 180, 150, 230, 150);
    board.key_down(kBoardKitKeyR);
    PrintBoard(board, "after move");

    // Select everything in a box and delete it, then undo.
    board.box_select_begin(50, 50);
    board.box_select_update(560, 260);
    board.box_select_end();
    std::printf("box selected %zu objects\n", board.selection().size());
    board.delete_selected();
    PrintBoard(board, "after delete");
    while (board.can_undo()) board.undo();
    PrintBoard(board, "fully undone");
    while (board.can_redo()) board.redo();
    PrintBoard(board, "fully redone");

    // Render a frame.
    const int width = 800;
    const int height = 500;
    std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * 4);
    board.set_viewport(1.0, 0, 0);
    try {
      board.render(pixels.data(), width, height, width * 4);
      const char* out = argc > 1 ? argv[1] : "boardkit_demo.ppm";
      if (WritePpm(out, pixels, width, height)) {
        std::printf("rendered %dx%d frame to %s\n", width, height, out);
      }
    } catch (const boardkit::Error& e) {
      if (e.code() != kBoardKitErrorNotSupported) throw;
      std::printf("rendering not available in this build\n");
    }
  } catch (const boardkit::Error& e) {
    std::fprintf(stderr, "boardkit error %d: %s\n", static_cast<int>(e.code()),
                 e.what());
    boardkit_set_log_callback(nullptr, nullptr);
    return 1;
  }

  boardkit_set_log_callback(nullptr, nullptr);
  return 0;
}
