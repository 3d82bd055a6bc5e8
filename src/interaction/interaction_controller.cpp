// Copyright 2026 The boardkit Authors

#include "interaction/interaction_controller.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

#include "core/logger.h"
#include "history/history_action.h"
#include "scene/rich_text.h"

namespace boardkit {
namespace internal {

namespace {

/// History snapshots never carry the transient editing flag.
SceneObject Snapshot(const SceneObject& obj) {
  SceneObject copy = obj;
  if (TextBody* text = copy.text()) text->is_editing = false;
  return copy;
}

bool IsBoxLike(const SceneObject& obj) {
  return !obj.IsSegment() && obj.kind() != ObjectKind::kColorPalette;
}

}  // namespace

const char* InteractionStateName(InteractionState state) {
  switch (state) {
    case InteractionState::kIdle:
      return "idle";
    case InteractionState::kDrawing:
      return "drawing";
    case InteractionState::kDragging:
      return "dragging";
    case InteractionState::kResizing:
      return "resizing";
    case InteractionState::kRotating:
      return "rotating";
    case InteractionState::kBoxSelecting:
      return "box_selecting";
  }
  return "unknown";
}

InteractionController::InteractionController(SceneModel* scene,
                                             SelectionManager* selection,
                                             HistoryManager* history,
                                             const Viewport* viewport)
    : scene_(scene),
      selection_(selection),
      history_(history),
      viewport_(viewport) {
  scene_->AddListener(this);
}

InteractionController::~InteractionController() {
  scene_->RemoveListener(this);
}

void InteractionController::SetTextSurface(TextEditSurface* surface) {
  if (is_editing_text()) CommitTextEdit();
  text_surface_ = surface;
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------

void InteractionController::SetTool(Tool tool, const ShapeToolStyle* style) {
  if (style) shape_style_ = *style;
  if (state_ == InteractionState::kDrawing) ResetGesture();
  tool_ = tool;
  if (tool_ != Tool::kNone) {
    if (is_editing_text()) CommitTextEdit();
    ClearSelection();
  }
  scene_->RequestRedraw();
}

void InteractionController::NotifyToolChanged() {
  if (observer_) observer_->OnToolChanged(tool_);
}

// ---------------------------------------------------------------------------
// Pointer input
// ---------------------------------------------------------------------------

void InteractionController::PointerDown(double x, double y,
                                        const Modifiers& mods) {
  if (state_ != InteractionState::kIdle) return;

  if (is_editing_text()) {
    const SceneObject* edited = scene_->Find(editing_id_);
    if (edited && ObjectContainsPoint(*edited, x, y)) return;
    CommitTextEdit();
  }

  if (tool_ == Tool::kNone) {
    if (TryBeginResize(x, y)) return;
    if (TryBeginRotate(x, y)) return;
  }

  if (const SceneObject* hit = scene_->FindAtPoint(x, y)) {
    if (tool_ != Tool::kNone) return;
    std::string id = hit->id;
    bool multi = mods.multi();
    bool keep_group = selection_->size() > 1 && selection_->Contains(id) &&
                      !multi;
    if (!keep_group) selection_->Select(id, multi);
    if (selection_->Contains(id)) BeginDrag(x, y);
    return;
  }

  if (tool_ == Tool::kNone) {
    if (!mods.multi()) ClearSelection();
    return;
  }

  BeginDraw(x, y);
}

void InteractionController::PointerMove(double x, double y,
                                        const Modifiers& /*mods*/) {
  switch (state_) {
    case InteractionState::kDrawing:
      UpdateDraw(x, y);
      break;
    case InteractionState::kDragging:
      UpdateDrag(x, y);
      break;
    case InteractionState::kResizing:
      UpdateResize(x, y);
      break;
    case InteractionState::kRotating:
      UpdateRotate(x, y);
      break;
    case InteractionState::kBoxSelecting:
      UpdateBoxSelection(x, y);
      break;
    case InteractionState::kIdle:
      break;
  }
}

void InteractionController::PointerUp(double x, double y,
                                      const Modifiers& mods) {
  switch (state_) {
    case InteractionState::kDrawing:
      UpdateDraw(x, y);
      FinishDraw();
      break;
    case InteractionState::kDragging:
      FinishDrag();
      break;
    case InteractionState::kResizing:
      UpdateResize(x, y);
      FinishResize();
      break;
    case InteractionState::kRotating:
      UpdateRotate(x, y);
      FinishRotate();
      break;
    case InteractionState::kBoxSelecting:
      UpdateBoxSelection(x, y);
      EndBoxSelection(mods);
      return;
    case InteractionState::kIdle:
      return;
  }
  ResetGesture();
  scene_->RequestRedraw();
}

bool InteractionController::DoubleClick(double x, double y) {
  if (state_ != InteractionState::kIdle) return false;
  const SceneObject* hit = scene_->FindAtPoint(x, y);
  if (!hit || hit->kind() != ObjectKind::kText) return false;
  return StartTextEdit(hit->id);
}

bool InteractionController::HandleKey(Key key, const Modifiers& mods) {
  if (is_editing_text()) {
    if (key != Key::kEscape) return false;
    CommitTextEdit();
    return true;
  }
  if (state_ != InteractionState::kIdle) return false;

  switch (key) {
    case Key::kDelete:
    case Key::kBackspace:
      if (selection_->empty()) return false;
      DeleteSelected();
      return true;
    case Key::kR:
      if (mods.command() || selection_->empty()) return false;
      ResetRotation();
      return true;
    case Key::kZ:
      if (!mods.command()) return false;
      if (mods.shift) {
        Redo();
      } else {
        Undo();
      }
      return true;
    case Key::kY:
      if (!mods.command()) return false;
      Redo();
      return true;
    case Key::kEscape:
    case Key::kOther:
      return false;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Gesture start
// ---------------------------------------------------------------------------

double InteractionController::zoom() const {
  return viewport_ ? viewport_->zoom() : 1.0;
}

bool InteractionController::TryBeginResize(double x, double y) {
  if (!selection_->IsSingle()) return false;
  const std::string id = *selection_->primary();
  std::optional<HandleId> handle =
      scene_->FindResizeHandle(id, x, y, zoom());
  if (!handle) return false;

  const SceneObject* obj = scene_->Find(id);
  state_ = InteractionState::kResizing;
  resize_id_ = id;
  resize_handle_ = handle;
  resize_baseline_ = Snapshot(*obj);
  BOARDKIT_LOG_DEBUG("Resize {} via handle {}", id, HandleName(*handle));
  return true;
}

bool InteractionController::TryBeginRotate(double x, double y) {
  const SceneObject* grabbed = nullptr;
  for (const std::string& id : selection_->ids()) {
    const SceneObject* obj = scene_->Find(id);
    if (obj && obj->visible && HitRotationHandle(*obj, x, y, zoom())) {
      grabbed = obj;
      break;
    }
  }
  if (!grabbed) return false;

  if (selection_->IsSingle()) {
    rotation_pivot_ = ObjectPivot(*grabbed);
  } else {
    std::optional<Rect> bounds;
    for (const std::string& id : selection_->ids()) {
      const SceneObject* obj = scene_->Find(id);
      if (!obj) continue;
      Rect r = ObjectBounds(*obj);
      bounds = bounds ? UnionRect(*bounds, r) : r;
    }
    rotation_pivot_ = bounds->center();
  }

  rotation_start_angle_ =
      std::atan2(y - rotation_pivot_.y, x - rotation_pivot_.x);
  rotation_starts_.clear();
  rotation_before_.clear();
  for (const std::string& id : selection_->ids()) {
    const SceneObject* obj = scene_->Find(id);
    if (!obj) continue;
    rotation_starts_[id] = CaptureRotationStart(*obj);
    rotation_before_[id] = Snapshot(*obj);
  }
  state_ = InteractionState::kRotating;
  return true;
}

void InteractionController::BeginDrag(double x, double y) {
  drag_starts_.clear();
  for (const std::string& id : selection_->ids()) {
    const SceneObject* obj = scene_->Find(id);
    if (!obj) continue;
    DragStart start;
    start.x = obj->x;
    start.y = obj->y;
    if (obj->IsSegment()) start.end = Point{obj->shape()->x2, obj->shape()->y2};
    start.offset = Point{x - obj->x, y - obj->y};
    drag_starts_[id] = start;
  }
  snap_guides_.clear();
  state_ = InteractionState::kDragging;
}

void InteractionController::BeginDraw(double x, double y) {
  DrawPreview preview;
  preview.tool = tool_;
  preview.anchor = Point{x, y};
  preview.current = Point{x, y};
  preview.object = BuildPreviewObject(preview.anchor, preview.current);
  preview_ = std::move(preview);
  state_ = InteractionState::kDrawing;
}

// ---------------------------------------------------------------------------
// Gesture update
// ---------------------------------------------------------------------------

void InteractionController::UpdateDrag(double x, double y) {
  const bool single = drag_starts_.size() == 1;
  snap_guides_.clear();
  for (const auto& entry : drag_starts_) {
    SceneObject* obj = scene_->Find(entry.first);
    if (!obj) continue;
    double nx = x - entry.second.offset.x;
    double ny = y - entry.second.offset.y;
    if (single && snapping_enabled_ && snap_resolver_) {
      SnapResult snapped = snap_resolver_->Resolve(nx, ny, *obj);
      nx = snapped.x;
      ny = snapped.y;
      snap_guides_ = std::move(snapped.guides);
    }
    TranslateObject(obj, nx - obj->x, ny - obj->y);
  }
  scene_->RequestRedraw();
}

void InteractionController::UpdateResize(double x, double y) {
  SceneObject* obj = scene_->Find(resize_id_);
  if (!obj || !resize_baseline_ || !resize_handle_) return;
  const SceneObject& baseline = *resize_baseline_;

  // Every update starts again from the geometry captured at gesture start.
  bool editing = obj->text() && obj->text()->is_editing;
  *obj = baseline;
  if (editing) obj->text()->is_editing = true;

  // Resize math runs in the unrotated frame of the baseline.
  Point local = ToObjectLocal(baseline, x, y);
  ResizeObject(obj, *resize_handle_, local.x, local.y, limits_);

  // The object turns about its new centre, so shift it until the anchor
  // is back at its world position.
  if (baseline.rotation != 0.0) {
    Point before = ToWorld(baseline, ResizeAnchor(baseline, *resize_handle_));
    Point after = ToWorld(*obj, ResizeAnchor(*obj, *resize_handle_));
    TranslateObject(obj, before.x - after.x, before.y - after.y);
  }
  scene_->RequestRedraw();
}

void InteractionController::UpdateRotate(double x, double y) {
  double angle = std::atan2(y - rotation_pivot_.y, x - rotation_pivot_.x);
  double delta = RadiansToDegrees(angle - rotation_start_angle_);
  bool orbit = rotation_starts_.size() > 1;
  for (const auto& entry : rotation_starts_) {
    SceneObject* obj = scene_->Find(entry.first);
    if (obj) RotateFromStart(obj, entry.second, rotation_pivot_, delta, orbit);
  }
  scene_->RequestRedraw();
}

void InteractionController::UpdateDraw(double x, double y) {
  if (!preview_) return;
  preview_->current = Point{x, y};
  preview_->object = BuildPreviewObject(preview_->anchor, preview_->current);
  scene_->RequestRedraw();
}

SceneObject InteractionController::BuildPreviewObject(
    const Point& anchor, const Point& current) const {
  SceneObject obj;
  Rect box = NormalizedRect(anchor, current);

  if (tool_ == Tool::kText) {
    obj.x = box.x;
    obj.y = box.y;
    obj.width = box.width;
    obj.height = box.height;
    TextBody text;
    text.content.push_back(TextRun{kDefaultTextContent, text.default_style});
    obj.body = std::move(text);
    return obj;
  }

  ShapeBody shape;
  shape.shape_type = shape_style_.type;
  shape.fill_color = shape_style_.fill_color;
  shape.has_stroke = shape_style_.has_stroke;
  shape.stroke_color = shape_style_.stroke_color;
  shape.stroke_width = shape_style_.stroke_width;
  if (IsSegmentShape(shape.shape_type)) {
    // Literal endpoints, no normalisation.
    obj.x = anchor.x;
    obj.y = anchor.y;
    shape.x2 = current.x;
    shape.y2 = current.y;
  } else {
    obj.x = box.x;
    obj.y = box.y;
    obj.width = box.width;
    obj.height = box.height;
  }
  obj.body = std::move(shape);
  return obj;
}

// ---------------------------------------------------------------------------
// Gesture finish
// ---------------------------------------------------------------------------

void InteractionController::FinishDrag() {
  std::vector<MoveItem> items;
  for (const auto& entry : drag_starts_) {
    const SceneObject* obj = scene_->Find(entry.first);
    if (!obj) continue;
    const DragStart& start = entry.second;
    MoveItem item;
    item.id = entry.first;
    item.old_x = start.x;
    item.old_y = start.y;
    item.new_x = obj->x;
    item.new_y = obj->y;
    if (start.end && obj->IsSegment()) {
      item.old_end = start.end;
      item.new_end = Point{obj->shape()->x2, obj->shape()->y2};
    }
    bool moved = item.old_x != item.new_x || item.old_y != item.new_y;
    if (item.old_end && (item.old_end->x != item.new_end->x ||
                         item.old_end->y != item.new_end->y)) {
      moved = true;
    }
    if (moved) items.push_back(std::move(item));
  }
  if (items.empty()) return;

  history_->Push(MakeMoveMultipleAction(std::move(items)));
  scene_->NotifyChanged();
}

void InteractionController::FinishResize() {
  const SceneObject* obj = scene_->Find(resize_id_);
  if (!obj || !resize_baseline_) return;
  SceneObject after = Snapshot(*obj);
  if (after == *resize_baseline_) return;

  std::vector<ObjectChange> changes;
  changes.push_back(ObjectChange{resize_id_, *resize_baseline_, after});
  history_->Push(MakeUpdateObjectAction(std::move(changes)));
  scene_->NotifyChanged();
}

void InteractionController::FinishRotate() {
  CommitChanges(rotation_before_);
}

void InteractionController::FinishDraw() {
  if (!preview_) return;
  const DrawPreview& preview = *preview_;
  Rect box = NormalizedRect(preview.anchor, preview.current);

  bool large_enough = false;
  if (preview.tool == Tool::kText) {
    large_enough =
        box.width > kMinTextDrawWidth && box.height > kMinTextDrawHeight;
  } else {
    large_enough =
        Distance(preview.anchor, preview.current) > kMinShapeDrawDistance;
  }
  if (!large_enough) {
    BOARDKIT_LOG_DEBUG("Draw gesture too small, discarded");
    return;
  }

  SceneObject obj = preview.object;
  if (IsBoxLike(obj)) {
    obj.width = (std::max)(limits_.min_object_size, obj.width);
    obj.height = (std::max)(limits_.min_object_size, obj.height);
  }

  SceneObject* created = scene_->Add(std::move(obj));
  const std::string id = created->id;
  selection_->Apply({id}, SelectionManager::Mode::kReplace);

  tool_ = Tool::kNone;
  NotifyToolChanged();

  history_->Push(MakeAddObjectAction(Snapshot(*scene_->Find(id))));
}

size_t InteractionController::CommitChanges(
    const std::map<std::string, SceneObject>& before) {
  std::vector<ObjectChange> changes;
  for (const auto& entry : before) {
    const SceneObject* obj = scene_->Find(entry.first);
    if (!obj) continue;
    SceneObject after = Snapshot(*obj);
    if (after == entry.second) continue;
    changes.push_back(ObjectChange{entry.first, entry.second, after});
  }
  if (changes.empty()) return 0;

  size_t count = changes.size();
  history_->Push(MakeUpdateObjectAction(std::move(changes)));
  scene_->RequestRedraw();
  scene_->NotifyChanged();
  return count;
}

void InteractionController::FinishActiveGesture() {
  switch (state_) {
    case InteractionState::kDragging:
      FinishDrag();
      break;
    case InteractionState::kResizing:
      FinishResize();
      break;
    case InteractionState::kRotating:
      FinishRotate();
      break;
    case InteractionState::kDrawing:
    case InteractionState::kBoxSelecting:
    case InteractionState::kIdle:
      break;
  }
  ResetGesture();
}

void InteractionController::ResetGesture() {
  state_ = InteractionState::kIdle;
  preview_.reset();
  drag_starts_.clear();
  snap_guides_.clear();
  resize_handle_.reset();
  resize_id_.clear();
  resize_baseline_.reset();
  rotation_starts_.clear();
  rotation_before_.clear();
}

// ---------------------------------------------------------------------------
// Box selection
// ---------------------------------------------------------------------------

bool InteractionController::BeginBoxSelection(double x, double y) {
  if (state_ != InteractionState::kIdle) return false;
  box_anchor_ = Point{x, y};
  box_current_ = box_anchor_;
  state_ = InteractionState::kBoxSelecting;
  return true;
}

void InteractionController::UpdateBoxSelection(double x, double y) {
  if (state_ != InteractionState::kBoxSelecting) return;
  box_current_ = Point{x, y};
  scene_->RequestRedraw();
}

size_t InteractionController::EndBoxSelection(const Modifiers& mods) {
  if (state_ != InteractionState::kBoxSelecting) return 0;
  Rect box = NormalizedRect(box_anchor_, box_current_);
  state_ = InteractionState::kIdle;
  scene_->RequestRedraw();

  if (box.width <= kMinBoxSelectExtent || box.height <= kMinBoxSelectExtent)
    return 0;

  std::vector<std::string> ids = scene_->ObjectsIntersecting(box);
  selection_->Apply(ids, mods.multi() ? SelectionManager::Mode::kAdd
                                      : SelectionManager::Mode::kReplace);
  return ids.size();
}

std::optional<Rect> InteractionController::box_selection_rect() const {
  if (state_ != InteractionState::kBoxSelecting) return std::nullopt;
  return NormalizedRect(box_anchor_, box_current_);
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

size_t InteractionController::DeleteSelected() {
  if (selection_->empty()) return 0;
  if (is_editing_text() && selection_->Contains(editing_id_)) CommitTextEdit();

  std::vector<std::string> ids = selection_->ids();
  std::vector<SceneObject> removed;
  for (const std::string& id : ids) {
    if (const SceneObject* obj = scene_->Find(id)) {
      removed.push_back(Snapshot(*obj));
    }
  }
  if (removed.empty()) return 0;

  size_t count = scene_->Remove(ids);
  history_->Push(MakeDeleteObjectsAction(std::move(removed)));
  BOARDKIT_LOG_DEBUG("Deleted {} selected object(s)", count);
  return count;
}

bool InteractionController::UpdateObject(
    const std::string& id, const std::function<void(SceneObject*)>& mutator) {
  const SceneObject* obj = scene_->Find(id);
  if (!obj || !mutator) return false;

  SceneObject working = *obj;
  mutator(&working);
  working.id = id;
  if (TextBody* text = working.text()) {
    text->is_editing = obj->text() && obj->text()->is_editing;
    text->content = NormalizeRuns(std::move(text->content));
  }
  DerivePaletteGeometry(&working);
  if (IsBoxLike(working)) {
    working.width = (std::max)(limits_.min_object_size, working.width);
    working.height = (std::max)(limits_.min_object_size, working.height);
  }
  if (working == *obj) return false;

  SceneObject before = Snapshot(*obj);
  SceneObject after = Snapshot(working);
  scene_->Replace(working);

  std::vector<ObjectChange> changes;
  changes.push_back(ObjectChange{id, std::move(before), std::move(after)});
  history_->Push(MakeUpdateObjectAction(std::move(changes)));
  return true;
}

bool InteractionController::SetVisibility(const std::string& id,
                                          bool visible) {
  if (!visible && id == editing_id_) CommitTextEdit();
  bool changed =
      UpdateObject(id, [visible](SceneObject* obj) { obj->visible = visible; });
  if (!visible && selection_->Contains(id)) {
    selection_->Apply({id}, SelectionManager::Mode::kRemove);
  }
  return changed;
}

size_t InteractionController::ResetRotation() {
  std::map<std::string, SceneObject> before;
  for (const std::string& id : selection_->ids()) {
    SceneObject* obj = scene_->Find(id);
    if (!obj || obj->rotation == 0.0) continue;
    before[id] = Snapshot(*obj);
    obj->rotation = 0.0;
  }
  return CommitChanges(before);
}

bool InteractionController::ReorderTo(const ZOrderMap& after) {
  ZOrderMap before = scene_->CaptureZOrder();
  if (before == after) return false;
  scene_->ApplyZOrder(after);
  history_->Push(MakeReorderLayersAction(std::move(before), after));
  return true;
}

bool InteractionController::BringToFront(const std::string& id) {
  const SceneObject* obj = scene_->Find(id);
  if (!obj) return false;
  ZOrderMap order = scene_->CaptureZOrder();
  int top = obj->z_index;
  bool already_top = true;
  for (const auto& entry : order) {
    if (entry.first == id) continue;
    if (entry.second >= obj->z_index) already_top = false;
    top = (std::max)(top, entry.second);
  }
  // External layers (raster images) count as well.
  const int next = scene_->GetNextZIndex();
  if (next > obj->z_index + 1) already_top = false;
  if (already_top) return false;
  order[id] = (std::max)(top + 1, next);
  return ReorderTo(order);
}

bool InteractionController::SendToBack(const std::string& id) {
  const SceneObject* obj = scene_->Find(id);
  if (!obj) return false;
  ZOrderMap order = scene_->CaptureZOrder();
  int bottom = obj->z_index;
  bool already_bottom = true;
  for (const auto& entry : order) {
    if (entry.first == id) continue;
    if (entry.second <= obj->z_index) already_bottom = false;
    bottom = (std::min)(bottom, entry.second);
  }
  if (already_bottom) return false;
  order[id] = bottom - 1;
  return ReorderTo(order);
}

bool InteractionController::MoveLayer(const std::string& id, int direction) {
  if (direction == 0) return false;
  std::vector<const SceneObject*> ordered = scene_->ObjectsByZOrder();
  auto it = std::find_if(ordered.begin(), ordered.end(),
                         [&id](const SceneObject* o) { return o->id == id; });
  if (it == ordered.end()) return false;

  std::ptrdiff_t index = it - ordered.begin();
  std::ptrdiff_t neighbour = direction > 0 ? index + 1 : index - 1;
  if (neighbour < 0 ||
      neighbour >= static_cast<std::ptrdiff_t>(ordered.size()))
    return false;

  const SceneObject* self = ordered[index];
  const SceneObject* other = ordered[neighbour];
  ZOrderMap order = scene_->CaptureZOrder();
  if (self->z_index == other->z_index) {
    order[self->id] = other->z_index + (direction > 0 ? 1 : -1);
  } else {
    order[self->id] = other->z_index;
    order[other->id] = self->z_index;
  }
  return ReorderTo(order);
}

std::string InteractionController::AddText(double x, double y) {
  if (is_editing_text()) CommitTextEdit();
  SceneObject obj;
  obj.x = x;
  obj.y = y;
  obj.width = kDefaultTextWidth;
  obj.height = kDefaultTextHeight;
  TextBody text;
  text.content.push_back(TextRun{kDefaultTextContent, text.default_style});
  obj.body = std::move(text);

  SceneObject* created = scene_->Add(std::move(obj));
  const std::string id = created->id;
  selection_->Apply({id}, SelectionManager::Mode::kReplace);
  history_->Push(MakeAddObjectAction(Snapshot(*created)));
  return id;
}

std::string InteractionController::AddColorPalette(double x, double y,
                                                   const PaletteBody& palette) {
  if (palette.grid_cols < 1 || palette.grid_rows < 1) {
    BOARDKIT_LOG_WARN("Palette grid must be at least 1x1 (got {}x{})",
                      palette.grid_cols, palette.grid_rows);
    return std::string();
  }
  if (is_editing_text()) CommitTextEdit();

  SceneObject obj;
  obj.x = x;
  obj.y = y;
  PaletteBody body = palette;
  body.cell_size = (std::max)(limits_.min_palette_cell, body.cell_size);
  obj.body = std::move(body);

  SceneObject* created = scene_->Add(std::move(obj));
  const std::string id = created->id;
  selection_->Apply({id}, SelectionManager::Mode::kReplace);
  history_->Push(MakeAddObjectAction(Snapshot(*created)));
  return id;
}

bool InteractionController::SelectObject(const std::string& id, bool multi) {
  if (!scene_->Contains(id)) return false;
  selection_->Select(id, multi);
  scene_->RequestRedraw();
  return true;
}

void InteractionController::SelectAll() {
  std::vector<std::string> ids;
  for (const SceneObject* obj : scene_->ObjectsByZOrder()) {
    if (obj->visible) ids.push_back(obj->id);
  }
  selection_->Apply(ids, SelectionManager::Mode::kReplace);
  scene_->RequestRedraw();
}

void InteractionController::ClearSelection() {
  if (selection_->empty()) return;
  selection_->Clear();
  scene_->RequestRedraw();
}

// ---------------------------------------------------------------------------
// Inline text editing
// ---------------------------------------------------------------------------

SurfaceRect InteractionController::SurfaceRectFor(
    const SceneObject& obj) const {
  SurfaceRect rect;
  double z = zoom();
  Point origin = viewport_ ? viewport_->WorldToScreen(obj.x, obj.y)
                           : Point{obj.x, obj.y};
  rect.x = origin.x;
  rect.y = origin.y;
  rect.width = obj.width * z;
  rect.height = obj.height * z;
  rect.scale = z;
  return rect;
}

bool InteractionController::StartTextEdit(const std::string& id) {
  if (!text_surface_) return false;
  if (id == editing_id_) return true;
  const SceneObject* target = scene_->Find(id);
  if (!target || target->kind() != ObjectKind::kText) return false;

  if (is_editing_text()) CommitTextEdit();

  SceneObject* obj = scene_->Find(id);
  editing_before_ = Snapshot(*obj);
  obj->text()->is_editing = true;
  editing_id_ = id;
  selection_->Apply({id}, SelectionManager::Mode::kReplace);

  text_surface_->Open(*obj, SurfaceRectFor(*obj),
                      [this](std::vector<TextRun> runs) {
                        SyncTextContent(std::move(runs));
                      });
  scene_->RequestRedraw();
  BOARDKIT_LOG_DEBUG("Editing text {}", id);
  return true;
}

bool InteractionController::SyncTextContent(std::vector<TextRun> runs) {
  if (!is_editing_text()) return false;
  SceneObject* obj = scene_->Find(editing_id_);
  if (!obj || !obj->text()) return false;
  if (!ValidateRuns(runs)) {
    BOARDKIT_LOG_WARN("Ignoring invalid text content for {}", editing_id_);
    return false;
  }
  obj->text()->content = NormalizeRuns(std::move(runs));
  scene_->RequestRedraw();
  return true;
}

void InteractionController::CommitTextEdit() {
  if (!is_editing_text()) return;
  if (text_surface_ && text_surface_->is_open()) {
    SyncTextContent(text_surface_->Content());
  }

  const std::string id = editing_id_;
  std::optional<SceneObject> before = std::move(editing_before_);
  CloseTextSurface();

  SceneObject* obj = scene_->Find(id);
  if (!obj || !obj->text()) return;
  obj->text()->is_editing = false;
  scene_->RequestRedraw();

  if (before && *obj != *before) {
    std::vector<ObjectChange> changes;
    changes.push_back(ObjectChange{id, std::move(*before), *obj});
    history_->Push(MakeUpdateObjectAction(std::move(changes)));
    scene_->NotifyChanged();
  }
  BOARDKIT_LOG_DEBUG("Finished editing text {}", id);
}

void InteractionController::CloseTextSurface() {
  editing_id_.clear();
  editing_before_.reset();
  if (text_surface_ && text_surface_->is_open()) text_surface_->Close();
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

bool InteractionController::Undo() {
  if (is_editing_text()) CommitTextEdit();
  FinishActiveGesture();
  if (!history_->Undo()) return false;
  selection_->RetainIf(
      [this](const std::string& id) { return scene_->Contains(id); });
  return true;
}

bool InteractionController::Redo() {
  if (is_editing_text()) CommitTextEdit();
  FinishActiveGesture();
  if (!history_->Redo()) return false;
  selection_->RetainIf(
      [this](const std::string& id) { return scene_->Contains(id); });
  return true;
}

// ---------------------------------------------------------------------------
// Viewport and scene notifications
// ---------------------------------------------------------------------------

void InteractionController::OnViewportChanged() {
  if (is_editing_text() && text_surface_) {
    if (const SceneObject* obj = scene_->Find(editing_id_)) {
      text_surface_->Reposition(SurfaceRectFor(*obj));
    }
  }
  scene_->RequestRedraw();
}

void InteractionController::OnObjectsRemoving(
    const std::vector<std::string>& ids) {
  for (const std::string& id : ids) {
    if (id == editing_id_) CloseTextSurface();
    drag_starts_.erase(id);
    rotation_starts_.erase(id);
    rotation_before_.erase(id);
    if (id == resize_id_) ResetGesture();
  }
  selection_->Prune(ids);
}

}  // namespace internal
}  // namespace boardkit
