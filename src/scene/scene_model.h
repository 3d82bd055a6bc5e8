// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_SCENE_SCENE_MODEL_H_
#define BOARDKIT_SCENE_SCENE_MODEL_H_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "geometry/handles.h"
#include "scene/scene_object.h"

namespace boardkit {
namespace internal {

/// Receives scene mutations. Default implementations ignore everything.
class SceneListener {
 public:
  virtual ~SceneListener() = default;

  /// Called before the listed objects are erased; they are still findable.
  virtual void OnObjectsRemoving(const std::vector<std::string>& ids) {}

  /// Called once per committed mutation (or once per batch).
  virtual void OnObjectsChanged() {}
};

/// Z-order snapshot: object id -> zIndex.
using ZOrderMap = std::map<std::string, int>;

/// True if (x, y) lies on obj: box test for box-like objects, distance to
/// the segment for line/arrow. Rotated objects are tested in their own frame.
bool ObjectContainsPoint(const SceneObject& obj, double x, double y);

/// Canonical owner of every placed object, keyed by id.
///
/// Pointers returned by Find() stay valid until that object is removed.
class SceneModel {
 public:
  SceneModel();
  ~SceneModel();

  // Non-copyable.
  SceneModel(const SceneModel&) = delete;
  SceneModel& operator=(const SceneModel&) = delete;

  /// Groups several mutations into one OnObjectsChanged notification.
  class Batch {
   public:
    explicit Batch(SceneModel* scene) : scene_(scene) { ++scene_->batch_depth_; }
    ~Batch() { scene_->EndBatch(); }
    Batch(const Batch&) = delete;
    Batch& operator=(const Batch&) = delete;

   private:
    SceneModel* scene_;
  };

  // -- Listeners (non-owning) --

  void AddListener(SceneListener* listener);
  void RemoveListener(SceneListener* listener);

  /// Highest zIndex of layers owned outside the scene (raster images), or
  /// nullopt when there are none.
  void SetExternalZProvider(std::function<std::optional<int>()> provider);

  // -- Mutation --

  /// 1 + max zIndex over objects and external layers (0 when both are empty).
  int GetNextZIndex() const;

  /// Append a new object. Generates an id when empty and always assigns the
  /// next zIndex. Returns the stored object.
  SceneObject* Add(SceneObject object);

  /// Re-insert a snapshot verbatim (id and zIndex preserved).
  /// Returns false if the id is already present.
  bool Insert(SceneObject object);

  /// Remove every listed id that exists. Returns the number removed.
  size_t Remove(const std::vector<std::string>& ids);

  /// Overwrite the stored object with the same id. Unknown ids are a no-op.
  bool Replace(const SceneObject& object);

  /// Replace the whole collection (restore from persistence). Legacy text
  /// records are migrated. History is not touched.
  void Load(std::vector<SceneObject> objects);

  void Clear();

  // -- Queries --

  SceneObject* Find(const std::string& id);
  const SceneObject* Find(const std::string& id) const;
  bool Contains(const std::string& id) const { return objects_.count(id) > 0; }
  size_t size() const { return objects_.size(); }
  bool empty() const { return objects_.empty(); }

  /// Topmost visible object containing (x, y), or nullptr.
  const SceneObject* FindAtPoint(double x, double y) const;

  /// Resize handle of object id under (x, y) at the given zoom.
  std::optional<HandleId> FindResizeHandle(const std::string& id, double x,
                                           double y, double zoom) const;

  /// Every object in ascending zIndex order (paint order).
  std::vector<const SceneObject*> ObjectsByZOrder() const;

  /// Visible objects whose bounds intersect rect, in paint order.
  std::vector<std::string> ObjectsIntersecting(const Rect& rect) const;

  /// Union of the bounds of visible objects, or nullopt if none.
  std::optional<Rect> ContentBounds() const;

  // -- Z order --

  ZOrderMap CaptureZOrder() const;

  /// Apply zIndex values from map. Ids absent from the scene are ignored.
  void ApplyZOrder(const ZOrderMap& order);

  // -- Change tracking --

  void RequestRedraw() { needs_redraw_ = true; }
  bool needs_redraw() const { return needs_redraw_; }

  /// Returns and clears the redraw flag.
  bool ConsumeRedraw();

  /// Emit OnObjectsChanged (deferred while a Batch is open).
  void NotifyChanged();

 private:
  void EndBatch();
  void NotifyRemoving(const std::vector<std::string>& ids);

  std::unordered_map<std::string, SceneObject> objects_;
  std::vector<SceneListener*> listeners_;
  std::function<std::optional<int>()> external_z_provider_;
  bool needs_redraw_ = true;
  int batch_depth_ = 0;
  bool change_pending_ = false;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_SCENE_SCENE_MODEL_H_
