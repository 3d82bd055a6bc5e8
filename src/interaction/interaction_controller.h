// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_INTERACTION_INTERACTION_CONTROLLER_H_
#define BOARDKIT_INTERACTION_INTERACTION_CONTROLLER_H_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/board_events.h"
#include "geometry/geometry.h"
#include "geometry/handles.h"
#include "history/history_manager.h"
#include "interaction/object_transform.h"
#include "interaction/selection_manager.h"
#include "interaction/snap_engine.h"
#include "interaction/text_edit_surface.h"
#include "scene/scene_model.h"
#include "scene/scene_object.h"

namespace boardkit {
namespace internal {

enum class InteractionState {
  kIdle,
  kDrawing,
  kDragging,
  kResizing,
  kRotating,
  kBoxSelecting,
};

const char* InteractionStateName(InteractionState state);

struct Modifiers {
  bool shift = false;
  bool ctrl = false;
  bool meta = false;
  bool alt = false;

  /// Shift, Ctrl or Meta: the keys that extend a selection.
  bool multi() const { return shift || ctrl || meta; }
  bool command() const { return ctrl || meta; }
};

enum class Key { kOther, kDelete, kBackspace, kEscape, kR, kZ, kY };

/// Style bag applied to shapes created with the shape tool.
struct ShapeToolStyle {
  ShapeType type = ShapeType::kSquare;
  Color fill_color = kDefaultFillColor;
  bool has_stroke = true;
  Color stroke_color = kColorBlack;
  double stroke_width = 2.0;
};

/// Transient object shown while a draw gesture is in progress.
struct DrawPreview {
  Tool tool = Tool::kNone;
  Point anchor;
  Point current;
  SceneObject object;  // What pointer-up would create right now.
};

/// Pointer-driven editing state machine over a SceneModel.
///
/// All coordinates are world units; the caller maps screen input through
/// the viewport first. Every committed mutation is pushed to the history
/// and reported through SceneModel::NotifyChanged().
class InteractionController : public SceneListener {
 public:
  /// Text created with the text tool or AddText().
  static constexpr const char* kDefaultTextContent = "Double-click to edit";
  static constexpr double kDefaultTextWidth = 300.0;
  static constexpr double kDefaultTextHeight = 100.0;

  // Minimum drag extent for the draw tools to create anything.
  static constexpr double kMinTextDrawWidth = 30.0;
  static constexpr double kMinTextDrawHeight = 20.0;
  static constexpr double kMinShapeDrawDistance = 10.0;

  /// Box selections no larger than this (world units, each side) are
  /// treated as clicks.
  static constexpr double kMinBoxSelectExtent = 5.0;

  /// None of the pointers are owned; they must outlive the controller.
  InteractionController(SceneModel* scene, SelectionManager* selection,
                        HistoryManager* history, const Viewport* viewport);
  ~InteractionController() override;

  // Non-copyable.
  InteractionController(const InteractionController&) = delete;
  InteractionController& operator=(const InteractionController&) = delete;

  // -- Collaborators (non-owning, may be null) --

  void SetObserver(BoardObserver* observer) { observer_ = observer; }
  void SetSnapResolver(SnapResolver* resolver) { snap_resolver_ = resolver; }
  void SetSnappingEnabled(bool enabled) { snapping_enabled_ = enabled; }
  bool snapping_enabled() const { return snapping_enabled_; }

  /// Surface used for inline text editing. Any open edit is committed
  /// first.
  void SetTextSurface(TextEditSurface* surface);

  void SetResizeLimits(const ResizeLimits& limits) { limits_ = limits; }
  const ResizeLimits& resize_limits() const { return limits_; }

  // -- Tools --

  /// Activating a creation tool clears the selection.
  void SetTool(Tool tool, const ShapeToolStyle* style = nullptr);
  Tool tool() const { return tool_; }
  const ShapeToolStyle& shape_style() const { return shape_style_; }

  // -- Pointer input --

  void PointerDown(double x, double y, const Modifiers& mods);
  void PointerMove(double x, double y, const Modifiers& mods);
  void PointerUp(double x, double y, const Modifiers& mods);

  /// Starts inline editing when (x, y) hits a text object. Returns true if
  /// an edit was opened.
  bool DoubleClick(double x, double y);

  /// Returns true if the key was consumed.
  bool HandleKey(Key key, const Modifiers& mods);

  // -- Box selection --

  bool BeginBoxSelection(double x, double y);
  void UpdateBoxSelection(double x, double y);

  /// Returns the number of objects selected by the box.
  size_t EndBoxSelection(const Modifiers& mods);

  // -- Commands --

  /// Remove every selected object as one delete_objects action. Returns
  /// the number removed.
  size_t DeleteSelected();

  /// Controlled property update: mutator edits a copy of the object, which
  /// is then normalised and committed as one update_object action. Returns
  /// true if anything changed.
  bool UpdateObject(const std::string& id,
                    const std::function<void(SceneObject*)>& mutator);

  /// Hiding a selected object also deselects it.
  bool SetVisibility(const std::string& id, bool visible);

  /// Reset rotation of every selected object. Returns the number changed.
  size_t ResetRotation();

  bool BringToFront(const std::string& id);
  bool SendToBack(const std::string& id);

  /// Swap with the neighbour above (direction > 0) or below (< 0).
  bool MoveLayer(const std::string& id, int direction);

  /// Create a 300x100 text box at (x, y). Returns the new id.
  std::string AddText(double x, double y);

  /// Create a colour palette at (x, y). Returns the new id.
  std::string AddColorPalette(double x, double y, const PaletteBody& palette);

  bool SelectObject(const std::string& id, bool multi);
  void SelectAll();
  void ClearSelection();

  // -- Inline text editing --

  /// Open the text surface over a text object, committing any other edit.
  bool StartTextEdit(const std::string& id);

  /// Write a run array from the surface into the edited object.
  bool SyncTextContent(std::vector<TextRun> runs);

  /// Finish the open edit (pushes update_object if the content changed).
  void CommitTextEdit();

  bool is_editing_text() const { return !editing_id_.empty(); }
  const std::string& editing_id() const { return editing_id_; }

  // -- History --

  /// Commit any open edit, then undo/redo and drop stale selection ids.
  bool Undo();
  bool Redo();

  // -- Viewport --

  /// Follow a pan/zoom change (repositions the text surface).
  void OnViewportChanged();

  // -- Transient state for rendering --

  InteractionState state() const { return state_; }
  const std::optional<DrawPreview>& preview() const { return preview_; }
  const std::vector<SnapGuide>& snap_guides() const { return snap_guides_; }
  std::optional<Rect> box_selection_rect() const;
  std::optional<HandleId> active_handle() const { return resize_handle_; }

  // SceneListener:
  void OnObjectsRemoving(const std::vector<std::string>& ids) override;

 private:
  struct DragStart {
    double x = 0.0;
    double y = 0.0;
    std::optional<Point> end;
    Point offset;  // Pointer minus object origin.
  };

  double zoom() const;

  bool TryBeginResize(double x, double y);
  bool TryBeginRotate(double x, double y);
  void BeginDrag(double x, double y);
  void BeginDraw(double x, double y);

  void UpdateDrag(double x, double y);
  void UpdateResize(double x, double y);
  void UpdateRotate(double x, double y);
  void UpdateDraw(double x, double y);

  void FinishDrag();
  void FinishResize();
  void FinishRotate();
  void FinishDraw();

  SceneObject BuildPreviewObject(const Point& anchor,
                                 const Point& current) const;

  /// Push one update_object for every object that differs from its
  /// snapshot. Returns the number of changes recorded.
  size_t CommitChanges(const std::map<std::string, SceneObject>& before);

  bool ReorderTo(const ZOrderMap& after);

  SurfaceRect SurfaceRectFor(const SceneObject& obj) const;
  void CloseTextSurface();

  /// Records whatever an open drag, resize or rotate has changed so far,
  /// drops a draw preview or box selection, and returns to idle.
  void FinishActiveGesture();
  void ResetGesture();
  void NotifyToolChanged();

  SceneModel* scene_;            // Non-owning
  SelectionManager* selection_;  // Non-owning
  HistoryManager* history_;      // Non-owning
  const Viewport* viewport_;     // Non-owning
  BoardObserver* observer_ = nullptr;
  SnapResolver* snap_resolver_ = nullptr;
  TextEditSurface* text_surface_ = nullptr;
  bool snapping_enabled_ = true;
  ResizeLimits limits_;

  Tool tool_ = Tool::kNone;
  ShapeToolStyle shape_style_;
  InteractionState state_ = InteractionState::kIdle;

  // Drawing
  std::optional<DrawPreview> preview_;

  // Dragging
  std::map<std::string, DragStart> drag_starts_;
  std::vector<SnapGuide> snap_guides_;

  // Resizing
  std::optional<HandleId> resize_handle_;
  std::string resize_id_;
  std::optional<SceneObject> resize_baseline_;

  // Rotating
  Point rotation_pivot_;
  double rotation_start_angle_ = 0.0;
  std::map<std::string, RotationStart> rotation_starts_;
  std::map<std::string, SceneObject> rotation_before_;

  // Box selection
  Point box_anchor_;
  Point box_current_;

  // Inline text editing
  std::string editing_id_;
  std::optional<SceneObject> editing_before_;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_INTERACTION_INTERACTION_CONTROLLER_H_
