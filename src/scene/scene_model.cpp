// Copyright 2026 The boardkit Authors

#include "scene/scene_model.h"

#include <algorithm>
#include <utility>

#include "core/logger.h"
#include "scene/object_id.h"
#include "scene/rich_text.h"

namespace boardkit {
namespace internal {

bool ObjectContainsPoint(const SceneObject& obj, double x, double y) {
  Point local = ToObjectLocal(obj, x, y);
  if (obj.IsSegment()) {
    const ShapeBody* s = obj.shape();
    double distance =
        PointToSegmentDistance(local.x, local.y, obj.x, obj.y, s->x2, s->y2);
    return distance <= LineHitThreshold(s->stroke_width);
  }
  return PointInAxisAlignedBox(local.x, local.y, ObjectBounds(obj));
}

SceneModel::SceneModel() = default;
SceneModel::~SceneModel() = default;

void SceneModel::AddListener(SceneListener* listener) {
  if (!listener) return;
  if (std::find(listeners_.begin(), listeners_.end(), listener) ==
      listeners_.end()) {
    listeners_.push_back(listener);
  }
}

void SceneModel::RemoveListener(SceneListener* listener) {
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                   listeners_.end());
}

void SceneModel::SetExternalZProvider(
    std::function<std::optional<int>()> provider) {
  external_z_provider_ = std::move(provider);
}

int SceneModel::GetNextZIndex() const {
  int max_z = -1;
  for (const auto& entry : objects_) {
    max_z = (std::max)(max_z, entry.second.z_index);
  }
  if (external_z_provider_) {
    std::optional<int> external = external_z_provider_();
    if (external) max_z = (std::max)(max_z, *external);
  }
  return max_z + 1;
}

SceneObject* SceneModel::Add(SceneObject object) {
  if (object.id.empty() || Contains(object.id)) {
    object.id = GenerateObjectId();
    while (Contains(object.id)) object.id = GenerateObjectId();
  }
  object.z_index = GetNextZIndex();
  DerivePaletteGeometry(&object);

  std::string id = object.id;
  auto result = objects_.emplace(id, std::move(object));
  BOARDKIT_LOG_DEBUG("Added {} object {} (z={})",
                     ObjectKindName(result.first->second.kind()), id,
                     result.first->second.z_index);
  RequestRedraw();
  NotifyChanged();
  return &result.first->second;
}

bool SceneModel::Insert(SceneObject object) {
  if (object.id.empty() || Contains(object.id)) return false;
  std::string id = object.id;
  objects_.emplace(id, std::move(object));
  RequestRedraw();
  NotifyChanged();
  return true;
}

size_t SceneModel::Remove(const std::vector<std::string>& ids) {
  std::vector<std::string> present;
  for (const std::string& id : ids) {
    if (Contains(id) &&
        std::find(present.begin(), present.end(), id) == present.end()) {
      present.push_back(id);
    }
  }
  if (present.empty()) return 0;

  NotifyRemoving(present);
  for (const std::string& id : present) {
    objects_.erase(id);
  }
  BOARDKIT_LOG_DEBUG("Removed {} object(s)", present.size());
  RequestRedraw();
  NotifyChanged();
  return present.size();
}

bool SceneModel::Replace(const SceneObject& object) {
  auto it = objects_.find(object.id);
  if (it == objects_.end()) return false;
  it->second = object;
  RequestRedraw();
  NotifyChanged();
  return true;
}

void SceneModel::Load(std::vector<SceneObject> objects) {
  Batch batch(this);
  Clear();
  int migrated = 0;
  for (SceneObject& obj : objects) {
    if (TextBody* text = obj.text()) {
      if (MigrateLegacyText(text)) ++migrated;
      text->is_editing = false;
    }
    DerivePaletteGeometry(&obj);
    if (obj.id.empty()) obj.id = GenerateObjectId();
    std::string id = obj.id;
    if (!objects_.emplace(id, std::move(obj)).second) {
      BOARDKIT_LOG_WARN("Skipping duplicate object id {} during load", id);
    }
  }
  if (migrated > 0) {
    BOARDKIT_LOG_INFO("Migrated {} legacy text object(s)", migrated);
  }
  RequestRedraw();
  NotifyChanged();
}

void SceneModel::Clear() {
  if (objects_.empty()) return;
  std::vector<std::string> ids;
  ids.reserve(objects_.size());
  for (const auto& entry : objects_) ids.push_back(entry.first);
  Remove(ids);
}

SceneObject* SceneModel::Find(const std::string& id) {
  auto it = objects_.find(id);
  return it == objects_.end() ? nullptr : &it->second;
}

const SceneObject* SceneModel::Find(const std::string& id) const {
  auto it = objects_.find(id);
  return it == objects_.end() ? nullptr : &it->second;
}

const SceneObject* SceneModel::FindAtPoint(double x, double y) const {
  std::vector<const SceneObject*> ordered = ObjectsByZOrder();
  for (auto it = ordered.rbegin(); it != ordered.rend(); ++it) {
    const SceneObject* obj = *it;
    if (!obj->visible) continue;
    if (ObjectContainsPoint(*obj, x, y)) return obj;
  }
  return nullptr;
}

std::optional<HandleId> SceneModel::FindResizeHandle(const std::string& id,
                                                     double x, double y,
                                                     double zoom) const {
  const SceneObject* obj = Find(id);
  if (!obj || !obj->visible) return std::nullopt;
  return HitResizeHandle(*obj, x, y, zoom);
}

std::vector<const SceneObject*> SceneModel::ObjectsByZOrder() const {
  std::vector<const SceneObject*> ordered;
  ordered.reserve(objects_.size());
  for (const auto& entry : objects_) ordered.push_back(&entry.second);
  std::sort(ordered.begin(), ordered.end(),
            [](const SceneObject* a, const SceneObject* b) {
              if (a->z_index != b->z_index) return a->z_index < b->z_index;
              return a->id < b->id;
            });
  return ordered;
}

std::vector<std::string> SceneModel::ObjectsIntersecting(
    const Rect& rect) const {
  std::vector<std::string> ids;
  for (const SceneObject* obj : ObjectsByZOrder()) {
    if (!obj->visible) continue;
    if (RectsIntersect(rect, ObjectBounds(*obj))) ids.push_back(obj->id);
  }
  return ids;
}

std::optional<Rect> SceneModel::ContentBounds() const {
  std::optional<Rect> bounds;
  for (const auto& entry : objects_) {
    if (!entry.second.visible) continue;
    Rect r = ObjectBounds(entry.second);
    bounds = bounds ? UnionRect(*bounds, r) : r;
  }
  return bounds;
}

ZOrderMap SceneModel::CaptureZOrder() const {
  ZOrderMap order;
  for (const auto& entry : objects_) {
    order[entry.first] = entry.second.z_index;
  }
  return order;
}

void SceneModel::ApplyZOrder(const ZOrderMap& order) {
  bool changed = false;
  for (const auto& item : order) {
    SceneObject* obj = Find(item.first);
    if (obj && obj->z_index != item.second) {
      obj->z_index = item.second;
      changed = true;
    }
  }
  if (!changed) return;
  RequestRedraw();
  NotifyChanged();
}

bool SceneModel::ConsumeRedraw() {
  bool was = needs_redraw_;
  needs_redraw_ = false;
  return was;
}

void SceneModel::NotifyChanged() {
  if (batch_depth_ > 0) {
    change_pending_ = true;
    return;
  }
  // Copy: a listener may unregister itself.
  std::vector<SceneListener*> listeners = listeners_;
  for (SceneListener* l : listeners) l->OnObjectsChanged();
}

void SceneModel::EndBatch() {
  if (--batch_depth_ > 0) return;
  if (change_pending_) {
    change_pending_ = false;
    NotifyChanged();
  }
}

void SceneModel::NotifyRemoving(const std::vector<std::string>& ids) {
  std::vector<SceneListener*> listeners = listeners_;
  for (SceneListener* l : listeners) l->OnObjectsRemoving(ids);
}

}  // namespace internal
}  // namespace boardkit
