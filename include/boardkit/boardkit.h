// Copyright 2026 The boardkit Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef BOARDKIT_BOARDKIT_H_
#define BOARDKIT_BOARDKIT_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32)
#if defined(BOARDKIT_BUILDING)
#define BOARDKIT_API __declspec(dllexport)
#else
#define BOARDKIT_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define BOARDKIT_API __attribute__((visibility("default")))
#else
#define BOARDKIT_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "boardkit/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
// General rules:
//   - A BoardKitBoard is single-threaded.  Pointer, keyboard, history and
//     render calls on the same board must be made from one thread (or be
//     serialized by the caller).  Different boards are independent.
//   - Observer callbacks run synchronously on the calling thread, inside the
//     API call that caused the change.  Do not destroy the board from inside
//     a callback.
//   - boardkit_set_log_level() and boardkit_set_log_callback() are
//     process-global and internally synchronized.
//   - boardkit_version_*() and boardkit_color_*() are stateless.
//
// Coordinates:
//   Pointer, hit-test and box-selection functions take SCREEN pixels and
//   convert them through the board viewport.  Object geometry reported by
//   boardkit_object_get_info() is in WORLD units.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct BoardKitBoard BoardKitBoard;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by boardkit functions.
typedef enum BoardKitError {
  kBoardKitOk = 0,
  kBoardKitErrorInvalidParam = -2,
  kBoardKitErrorNotFound = -3,
  kBoardKitErrorInvalidState = -4,
  kBoardKitErrorOutOfMemory = -5,
  kBoardKitErrorNotSupported = -6,
  kBoardKitErrorHistoryEmpty = -15,
  kBoardKitErrorConfigFailed = -20,
  kBoardKitErrorUnknown = -99,
} BoardKitError;

/// Log severity levels for the internal logging system.
typedef enum BoardKitLogLevel {
  kBoardKitLogTrace = 0,   ///< Very detailed diagnostic info
  kBoardKitLogDebug = 1,   ///< Debug-level messages
  kBoardKitLogInfo = 2,    ///< Informational messages (default)
  kBoardKitLogWarn = 3,    ///< Warnings
  kBoardKitLogError = 4,   ///< Errors
  kBoardKitLogFatal = 5,   ///< Fatal / critical errors
} BoardKitLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to boardkit_set_log_callback.
typedef void (*boardkit_log_callback_t)(BoardKitLogLevel level,
                                        const char* message, void* userdata);

/// Object variant.
typedef enum BoardKitObjectKind {
  kBoardKitObjectShape = 0,
  kBoardKitObjectText = 1,
  kBoardKitObjectColorPalette = 2,
} BoardKitObjectKind;

/// Shape type (for kBoardKitObjectShape).
typedef enum BoardKitShapeType {
  kBoardKitShapeSquare = 0,
  kBoardKitShapeRectangle = 1,
  kBoardKitShapeCircle = 2,
  kBoardKitShapeTriangle = 3,
  kBoardKitShapeLine = 4,     ///< Uses x,y -> x2,y2
  kBoardKitShapeArrow = 5,    ///< Uses x,y -> x2,y2
  kBoardKitShapePolygon = 6,
} BoardKitShapeType;

/// Active creation tool.
typedef enum BoardKitTool {
  kBoardKitToolNone = 0,
  kBoardKitToolText = 1,
  kBoardKitToolShape = 2,
} BoardKitTool;

/// Modifier key bit flags.
typedef enum BoardKitModifier {
  kBoardKitModNone = 0,
  kBoardKitModShift = 1 << 0,
  kBoardKitModCtrl = 1 << 1,
  kBoardKitModMeta = 1 << 2,
  kBoardKitModAlt = 1 << 3,
} BoardKitModifier;

/// Keys understood by boardkit_key_down().
typedef enum BoardKitKey {
  kBoardKitKeyOther = 0,
  kBoardKitKeyDelete = 1,
  kBoardKitKeyBackspace = 2,
  kBoardKitKeyEscape = 3,
  kBoardKitKeyR = 4,
  kBoardKitKeyZ = 5,
  kBoardKitKeyY = 6,
} BoardKitKey;

/// Interaction controller state.
typedef enum BoardKitInteractionState {
  kBoardKitStateIdle = 0,
  kBoardKitStateDrawing = 1,
  kBoardKitStateDragging = 2,
  kBoardKitStateResizing = 3,
  kBoardKitStateRotating = 4,
  kBoardKitStateBoxSelecting = 5,
} BoardKitInteractionState;

/// Text alignment inside a text box.
typedef enum BoardKitTextAlign {
  kBoardKitAlignLeft = 0,
  kBoardKitAlignCenter = 1,
  kBoardKitAlignRight = 2,
} BoardKitTextAlign;

/// Shape style bag used by the shape tool and property updates.
typedef struct BoardKitShapeStyle {
  BoardKitShapeType type;  ///< Shape created by the tool
  uint32_t fill_color;     ///< Fill color in ARGB format (0xAARRGGBB)
  int has_stroke;          ///< Non-zero to draw the outline
  uint32_t stroke_color;   ///< Stroke color in ARGB
  float stroke_width;      ///< Stroke width in world units
} BoardKitShapeStyle;

/// Snapshot of one object's public fields.
typedef struct BoardKitObjectInfo {
  char id[64];                  ///< Object id (UTF-8, null-terminated)
  BoardKitObjectKind kind;
  BoardKitShapeType shape_type; ///< Valid for kBoardKitObjectShape
  double x;
  double y;
  double width;
  double height;
  double x2;                    ///< Line/arrow endpoint
  double y2;
  double rotation;              ///< Degrees
  int z_index;
  int visible;
  int is_editing;               ///< Text object is in inline edit mode
} BoardKitObjectInfo;

/// Undo/redo stack sizes.
typedef struct BoardKitHistoryStats {
  int undo_count;
  int redo_count;
  int max_history;
} BoardKitHistoryStats;

/// Board observer. Every member may be NULL.
typedef struct BoardKitObserver {
  /// Any add/delete/update/reorder was committed.
  void (*objects_changed)(void* userdata);
  /// The active tool changed (kBoardKitToolNone after auto-deactivation).
  void (*tool_changed)(BoardKitTool tool, void* userdata);
  /// The selection set changed.
  void (*selection_changed)(void* userdata);
  void* userdata;
} BoardKitObserver;

/// Host callbacks for the inline text editing surface. The rectangle is in
/// screen pixels and scale is the current zoom. Every member may be NULL.
typedef struct BoardKitTextSurfaceCallbacks {
  void (*open)(const char* object_id, double x, double y, double width,
               double height, double scale, void* userdata);
  void (*reposition)(double x, double y, double width, double height,
                     double scale, void* userdata);
  void (*close)(void* userdata);
  void* userdata;
} BoardKitTextSurfaceCallbacks;

// ---------------------------------------------------------------------------
// Board management
// ---------------------------------------------------------------------------

/// Create a new, empty board with default settings.
///
/// @return A new board, or NULL on failure.
BOARDKIT_API BoardKitBoard* boardkit_board_create(void);

/// Destroy a board and every object it owns.
///
/// @param board  Board to destroy. NULL is safely ignored.
BOARDKIT_API void boardkit_board_destroy(BoardKitBoard* board);

/// Register (or clear, with NULL) the board observer.
BOARDKIT_API void boardkit_set_observer(BoardKitBoard* board,
                                        const BoardKitObserver* observer);

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

/// Get the error code from the last failed operation on this board.
BOARDKIT_API BoardKitError boardkit_get_last_error(const BoardKitBoard* board);

/// Get a human-readable error message for the last failed operation.
///
/// Lifetime: The returned string is valid until the next API call on the
/// same board.
///
/// @return UTF-8 error message. Never returns NULL.
BOARDKIT_API const char* boardkit_get_last_error_message(
    const BoardKitBoard* board);

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------

/// Select the creation tool. Setting a tool clears the selection.
/// @param style  Shape style for kBoardKitToolShape (NULL = defaults).
BOARDKIT_API BoardKitError boardkit_set_tool(BoardKitBoard* board,
                                             BoardKitTool tool,
                                             const BoardKitShapeStyle* style);

BOARDKIT_API BoardKitTool boardkit_get_tool(const BoardKitBoard* board);

/// Default style used by the shape tool when no style is given.
BOARDKIT_API void boardkit_default_shape_style(BoardKitShapeStyle* out_style);

// ---------------------------------------------------------------------------
// Viewport
// ---------------------------------------------------------------------------

BOARDKIT_API BoardKitError boardkit_set_viewport(BoardKitBoard* board,
                                                 double zoom, double pan_x,
                                                 double pan_y);

BOARDKIT_API BoardKitError boardkit_get_viewport(const BoardKitBoard* board,
                                                 double* out_zoom,
                                                 double* out_pan_x,
                                                 double* out_pan_y);

/// Zoom by factor keeping the world point under (screen_x, screen_y) fixed.
/// Wheel handlers typically pass 1.1 (in) or 0.9 (out).
BOARDKIT_API BoardKitError boardkit_zoom_at(BoardKitBoard* board,
                                            double screen_x, double screen_y,
                                            double factor);

BOARDKIT_API BoardKitError boardkit_pan_by(BoardKitBoard* board, double dx,
                                           double dy);

/// Fit every visible object into a view of the given size (50 px padding).
BOARDKIT_API BoardKitError boardkit_fit_to_content(BoardKitBoard* board,
                                                   int view_width,
                                                   int view_height);

// ---------------------------------------------------------------------------
// Input events
// ---------------------------------------------------------------------------

/// @param modifiers  Bitwise OR of BoardKitModifier.
BOARDKIT_API BoardKitError boardkit_pointer_down(BoardKitBoard* board,
                                                 double screen_x,
                                                 double screen_y,
                                                 int modifiers);

BOARDKIT_API BoardKitError boardkit_pointer_move(BoardKitBoard* board,
                                                 double screen_x,
                                                 double screen_y);

BOARDKIT_API BoardKitError boardkit_pointer_up(BoardKitBoard* board,
                                               double screen_x,
                                               double screen_y);

/// Double-click. On a text object this opens inline editing.
BOARDKIT_API BoardKitError boardkit_double_click(BoardKitBoard* board,
                                                 double screen_x,
                                                 double screen_y);

/// Keyboard shortcut dispatch.
/// @return Non-zero if the key was consumed.
BOARDKIT_API int boardkit_key_down(BoardKitBoard* board, BoardKitKey key,
                                   int modifiers);

BOARDKIT_API BoardKitInteractionState boardkit_get_interaction_state(
    const BoardKitBoard* board);

// --- Box selection (driven by the host's unified selection layer) ---

BOARDKIT_API BoardKitError boardkit_box_select_begin(BoardKitBoard* board,
                                                     double screen_x,
                                                     double screen_y);
BOARDKIT_API BoardKitError boardkit_box_select_update(BoardKitBoard* board,
                                                      double screen_x,
                                                      double screen_y);
/// @param modifiers  Shift/Ctrl/Meta adds to the selection.
BOARDKIT_API BoardKitError boardkit_box_select_end(BoardKitBoard* board,
                                                   int modifiers);

// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------

BOARDKIT_API int boardkit_selection_count(const BoardKitBoard* board);

/// Copy the id of the index-th selected object (selection order) into buf.
BOARDKIT_API BoardKitError boardkit_selection_get_id(
    const BoardKitBoard* board, int index, char* buf, int buf_size);

/// Id of the primary (last touched) selected object, or empty string.
BOARDKIT_API BoardKitError boardkit_selection_get_primary(
    const BoardKitBoard* board, char* buf, int buf_size);

/// Select an object. Non-zero multi toggles membership.
BOARDKIT_API BoardKitError boardkit_select_object(BoardKitBoard* board,
                                                  const char* id, int multi);

BOARDKIT_API void boardkit_select_all(BoardKitBoard* board);
BOARDKIT_API void boardkit_clear_selection(BoardKitBoard* board);

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

BOARDKIT_API int boardkit_object_count(const BoardKitBoard* board);

/// Object at paint-order position index (0 = bottom).
BOARDKIT_API BoardKitError boardkit_object_get_info(const BoardKitBoard* board,
                                                    int index,
                                                    BoardKitObjectInfo* out);

BOARDKIT_API BoardKitError boardkit_object_find(const BoardKitBoard* board,
                                                const char* id,
                                                BoardKitObjectInfo* out);

/// Topmost visible object under a screen point.
/// @return kBoardKitOk with the id in buf, or kBoardKitErrorNotFound.
BOARDKIT_API BoardKitError boardkit_hit_test(BoardKitBoard* board,
                                             double screen_x, double screen_y,
                                             char* buf, int buf_size);

/// Delete every selected object as one undoable step.
BOARDKIT_API BoardKitError boardkit_delete_selected(BoardKitBoard* board);

BOARDKIT_API BoardKitError boardkit_object_set_visible(BoardKitBoard* board,
                                                       const char* id,
                                                       int visible);

BOARDKIT_API BoardKitError boardkit_object_set_shape_style(
    BoardKitBoard* board, const char* id, const BoardKitShapeStyle* style);

BOARDKIT_API BoardKitError boardkit_object_set_text_align(
    BoardKitBoard* board, const char* id, BoardKitTextAlign align);

/// Reset rotation of every selected object to 0.
BOARDKIT_API BoardKitError boardkit_reset_rotation(BoardKitBoard* board);

// --- Layers ---

BOARDKIT_API BoardKitError boardkit_bring_to_front(BoardKitBoard* board,
                                                   const char* id);
BOARDKIT_API BoardKitError boardkit_send_to_back(BoardKitBoard* board,
                                                 const char* id);
/// @param direction  Positive moves up one layer, negative moves down.
BOARDKIT_API BoardKitError boardkit_move_layer(BoardKitBoard* board,
                                               const char* id, int direction);

// --- Programmatic creation (world coordinates) ---

/// Add a 300x100 text box at (x, y). The id is copied into out_id if given.
BOARDKIT_API BoardKitError boardkit_add_text(BoardKitBoard* board, double x,
                                             double y, char* out_id,
                                             int out_id_size);

/// Add a colour palette. colors holds color_count ARGB values.
BOARDKIT_API BoardKitError boardkit_add_color_palette(
    BoardKitBoard* board, double x, double y, double cell_size, int cols,
    int rows, int has_wide_cell, const uint32_t* colors, int color_count,
    char* out_id, int out_id_size);

// ---------------------------------------------------------------------------
// Inline text editing
// ---------------------------------------------------------------------------

/// Register host callbacks that place the editing surface on screen.
BOARDKIT_API void boardkit_set_text_surface(
    BoardKitBoard* board, const BoardKitTextSurfaceCallbacks* callbacks);

/// Start editing a text object (commits any other open edit first).
BOARDKIT_API BoardKitError boardkit_text_edit_begin(BoardKitBoard* board,
                                                    const char* id);

/// Insert UTF-8 text at the caret of the open edit.
BOARDKIT_API BoardKitError boardkit_text_edit_insert(BoardKitBoard* board,
                                                     const char* utf8);

/// Delete the character before the caret.
BOARDKIT_API BoardKitError boardkit_text_edit_backspace(BoardKitBoard* board);

/// Move the caret to a UTF-8 byte offset.
BOARDKIT_API BoardKitError boardkit_text_edit_set_caret(BoardKitBoard* board,
                                                        int offset);

/// Finish the open edit, keeping the edited content.
BOARDKIT_API BoardKitError boardkit_text_edit_commit(BoardKitBoard* board);

/// Id of the object being edited, or empty string.
BOARDKIT_API BoardKitError boardkit_text_edit_get_id(const BoardKitBoard* board,
                                                     char* buf, int buf_size);

/// Copy the plain text of a text object into buf.
/// @return Length of the text in bytes, or -1 on failure.
BOARDKIT_API int boardkit_text_get_plain(const BoardKitBoard* board,
                                         const char* id, char* buf,
                                         int buf_size);

/// Number of styled runs of a text object, or -1 on failure.
BOARDKIT_API int boardkit_text_run_count(const BoardKitBoard* board,
                                         const char* id);

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

BOARDKIT_API BoardKitError boardkit_undo(BoardKitBoard* board);
BOARDKIT_API BoardKitError boardkit_redo(BoardKitBoard* board);
BOARDKIT_API int boardkit_can_undo(const BoardKitBoard* board);
BOARDKIT_API int boardkit_can_redo(const BoardKitBoard* board);
BOARDKIT_API BoardKitError boardkit_history_stats(const BoardKitBoard* board,
                                                  BoardKitHistoryStats* out);
BOARDKIT_API void boardkit_history_clear(BoardKitBoard* board);

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

/// Return non-zero (and clear the flag) if the board changed since the
/// last call.
BOARDKIT_API int boardkit_needs_redraw(BoardKitBoard* board);

/// Paint the board into a caller-owned B8G8R8A8 buffer.
/// Returns kBoardKitErrorNotSupported if the library was built without a
/// render back-end.
BOARDKIT_API BoardKitError boardkit_render_to_buffer(BoardKitBoard* board,
                                                     uint8_t* bgra, int width,
                                                     int height, int stride);

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

/// Load settings from an INI file (NULL = default location).
BOARDKIT_API BoardKitError boardkit_load_settings(BoardKitBoard* board,
                                                  const char* path);

/// Save settings to an INI file (NULL = default location).
BOARDKIT_API BoardKitError boardkit_save_settings(const BoardKitBoard* board,
                                                  const char* path);

/// @param threshold  Snap distance in screen pixels (default 3).
BOARDKIT_API BoardKitError boardkit_set_snapping(BoardKitBoard* board,
                                                 int enabled,
                                                 double threshold);

/// Bound the undo stack (default 50). Excess entries are dropped at once.
BOARDKIT_API BoardKitError boardkit_set_max_history(BoardKitBoard* board,
                                                    int max_history);

// ---------------------------------------------------------------------------
// Color utilities
// ---------------------------------------------------------------------------

/// Format an ARGB color as "#RRGGBB" (or "#RRGGBBAA"). buf >= 10 bytes.
BOARDKIT_API void boardkit_color_to_hex(uint32_t argb, char* buf,
                                        int buf_size, int include_alpha);

/// Parse "#RGB", "#RRGGBB" or "#RRGGBBAA" into ARGB.
BOARDKIT_API BoardKitError boardkit_color_from_hex(const char* hex,
                                                   uint32_t* out_argb);

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

/// Get the library version as a string (e.g. "1.0.0").
BOARDKIT_API const char* boardkit_version_string(void);

/// Get the major version number.
BOARDKIT_API int boardkit_version_major(void);

/// Get the minor version number.
BOARDKIT_API int boardkit_version_minor(void);

/// Get the patch version number.
BOARDKIT_API int boardkit_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum log level. Messages below this level are discarded.
/// Default level is kBoardKitLogInfo.
BOARDKIT_API void boardkit_set_log_level(BoardKitLogLevel level);

/// Set a user-defined log callback.
///
/// When a callback is registered, all log messages (at or above the current
/// level) are forwarded to the callback in addition to the default stderr
/// output.  Pass NULL as @p callback to unregister a previous callback.
BOARDKIT_API void boardkit_set_log_callback(boardkit_log_callback_t callback,
                                            void* userdata);

/// Emit a log message at the given level through the boardkit logging system.
BOARDKIT_API void boardkit_log(BoardKitLogLevel level, const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // BOARDKIT_BOARDKIT_H_
