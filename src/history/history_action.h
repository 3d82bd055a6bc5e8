// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_HISTORY_HISTORY_ACTION_H_
#define BOARDKIT_HISTORY_HISTORY_ACTION_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "geometry/geometry.h"
#include "scene/scene_model.h"
#include "scene/scene_object.h"

namespace boardkit {
namespace internal {

enum class ActionType {
  kAddObject,
  kDeleteObjects,
  kUpdateObject,
  kMoveMultiple,
  kReorderLayers,
};

const char* ActionTypeName(ActionType type);

// ---------------------------------------------------------------------------
// Payloads. Each carries full snapshots so that both directions can be
// applied without looking at the current scene.
// ---------------------------------------------------------------------------

struct AddObjectData {
  SceneObject object;
};

struct DeleteObjectsData {
  std::vector<SceneObject> objects;
};

struct ObjectChange {
  std::string id;
  SceneObject before;
  SceneObject after;
};

struct UpdateObjectData {
  std::vector<ObjectChange> changes;
};

struct MoveItem {
  std::string id;
  double old_x = 0.0;
  double old_y = 0.0;
  double new_x = 0.0;
  double new_y = 0.0;
  std::optional<Point> old_end;  // Line/arrow endpoint.
  std::optional<Point> new_end;
};

struct MoveMultipleData {
  std::vector<MoveItem> items;
};

struct ReorderLayersData {
  ZOrderMap before;
  ZOrderMap after;
};

/// Alternative order matches ActionType.
using ActionData = std::variant<AddObjectData, DeleteObjectsData,
                                UpdateObjectData, MoveMultipleData,
                                ReorderLayersData>;

/// A self-contained, reversible record of one committed mutation.
struct Action {
  ActionType type;
  ActionData data;
  int64_t timestamp = 0;  // Unix ms, stamped on push.
};

// -- Factories --

Action MakeAddObjectAction(const SceneObject& object);
Action MakeDeleteObjectsAction(std::vector<SceneObject> objects);
Action MakeUpdateObjectAction(std::vector<ObjectChange> changes);
Action MakeMoveMultipleAction(std::vector<MoveItem> items);
Action MakeReorderLayersAction(ZOrderMap before, ZOrderMap after);

/// Throws std::invalid_argument if the type tag disagrees with the payload
/// or the payload is missing required snapshots.
void ValidateAction(const Action& action);

/// Undo direction. Ids no longer present are skipped.
/// Throws std::invalid_argument on malformed actions.
void ApplyInverse(const Action& action, SceneModel* scene);

/// Redo direction. Throws std::invalid_argument on malformed actions.
void ApplyForward(const Action& action, SceneModel* scene);

/// Ids of every object the action touches.
std::vector<std::string> AffectedIds(const Action& action);

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_HISTORY_HISTORY_ACTION_H_
