// Copyright 2026 The boardkit Authors

#include "history/history_action.h"

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace boardkit {
namespace internal {

namespace {

enum class Direction { kInverse, kForward };

void SetPosition(SceneModel* scene, const std::string& id, double x, double y,
                 const std::optional<Point>& end) {
  SceneObject* obj = scene->Find(id);
  if (!obj) return;
  obj->x = x;
  obj->y = y;
  if (end) {
    if (ShapeBody* s = obj->shape()) {
      s->x2 = end->x;
      s->y2 = end->y;
    }
  }
  scene->RequestRedraw();
  scene->NotifyChanged();
}

void Apply(const Action& action, SceneModel* scene, Direction direction) {
  ValidateAction(action);
  bool inverse = direction == Direction::kInverse;
  SceneModel::Batch batch(scene);

  std::visit(
      [&](const auto& data) {
        using T = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<T, AddObjectData>) {
          if (inverse) {
            scene->Remove({data.object.id});
          } else if (!scene->Insert(data.object)) {
            scene->Replace(data.object);
          }
        } else if constexpr (std::is_same_v<T, DeleteObjectsData>) {
          if (inverse) {
            for (const SceneObject& obj : data.objects) {
              if (!scene->Insert(obj)) scene->Replace(obj);
            }
          } else {
            std::vector<std::string> ids;
            for (const SceneObject& obj : data.objects) ids.push_back(obj.id);
            scene->Remove(ids);
          }
        } else if constexpr (std::is_same_v<T, UpdateObjectData>) {
          // Objects deleted since the update was recorded are skipped.
          for (const ObjectChange& change : data.changes) {
            scene->Replace(inverse ? change.before : change.after);
          }
        } else if constexpr (std::is_same_v<T, MoveMultipleData>) {
          for (const MoveItem& item : data.items) {
            if (inverse) {
              SetPosition(scene, item.id, item.old_x, item.old_y,
                          item.old_end);
            } else {
              SetPosition(scene, item.id, item.new_x, item.new_y,
                          item.new_end);
            }
          }
        } else if constexpr (std::is_same_v<T, ReorderLayersData>) {
          scene->ApplyZOrder(inverse ? data.before : data.after);
        }
      },
      action.data);
}

}  // namespace

const char* ActionTypeName(ActionType type) {
  switch (type) {
    case ActionType::kAddObject:     return "add_object";
    case ActionType::kDeleteObjects: return "delete_objects";
    case ActionType::kUpdateObject:  return "update_object";
    case ActionType::kMoveMultiple:  return "move_multiple";
    case ActionType::kReorderLayers: return "reorder_layers";
  }
  return "unknown";
}

Action MakeAddObjectAction(const SceneObject& object) {
  return {ActionType::kAddObject, AddObjectData{object}};
}

Action MakeDeleteObjectsAction(std::vector<SceneObject> objects) {
  return {ActionType::kDeleteObjects, DeleteObjectsData{std::move(objects)}};
}

Action MakeUpdateObjectAction(std::vector<ObjectChange> changes) {
  return {ActionType::kUpdateObject, UpdateObjectData{std::move(changes)}};
}

Action MakeMoveMultipleAction(std::vector<MoveItem> items) {
  return {ActionType::kMoveMultiple, MoveMultipleData{std::move(items)}};
}

Action MakeReorderLayersAction(ZOrderMap before, ZOrderMap after) {
  return {ActionType::kReorderLayers,
          ReorderLayersData{std::move(before), std::move(after)}};
}

void ValidateAction(const Action& action) {
  if (static_cast<size_t>(action.type) != action.data.index()) {
    throw std::invalid_argument(std::string("Action type ") +
                                ActionTypeName(action.type) +
                                " does not match its payload");
  }

  std::visit(
      [](const auto& data) {
        using T = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<T, AddObjectData>) {
          if (data.object.id.empty())
            throw std::invalid_argument("add_object snapshot has no id");
        } else if constexpr (std::is_same_v<T, DeleteObjectsData>) {
          if (data.objects.empty())
            throw std::invalid_argument("delete_objects carries no snapshots");
          for (const SceneObject& obj : data.objects) {
            if (obj.id.empty())
              throw std::invalid_argument("delete_objects snapshot has no id");
          }
        } else if constexpr (std::is_same_v<T, UpdateObjectData>) {
          if (data.changes.empty())
            throw std::invalid_argument("update_object carries no changes");
          for (const ObjectChange& c : data.changes) {
            if (c.id.empty() || c.before.id != c.id || c.after.id != c.id)
              throw std::invalid_argument(
                  "update_object snapshots disagree with their id");
          }
        } else if constexpr (std::is_same_v<T, MoveMultipleData>) {
          if (data.items.empty())
            throw std::invalid_argument("move_multiple carries no items");
          for (const MoveItem& item : data.items) {
            if (item.id.empty())
              throw std::invalid_argument("move_multiple item has no id");
            if (item.old_end.has_value() != item.new_end.has_value())
              throw std::invalid_argument(
                  "move_multiple item has only one endpoint half");
          }
        } else if constexpr (std::is_same_v<T, ReorderLayersData>) {
          if (data.before.empty() || data.after.empty())
            throw std::invalid_argument("reorder_layers map is empty");
        }
      },
      action.data);
}

void ApplyInverse(const Action& action, SceneModel* scene) {
  Apply(action, scene, Direction::kInverse);
}

void ApplyForward(const Action& action, SceneModel* scene) {
  Apply(action, scene, Direction::kForward);
}

std::vector<std::string> AffectedIds(const Action& action) {
  std::vector<std::string> ids;
  std::visit(
      [&ids](const auto& data) {
        using T = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<T, AddObjectData>) {
          ids.push_back(data.object.id);
        } else if constexpr (std::is_same_v<T, DeleteObjectsData>) {
          for (const SceneObject& obj : data.objects) ids.push_back(obj.id);
        } else if constexpr (std::is_same_v<T, UpdateObjectData>) {
          for (const ObjectChange& c : data.changes) ids.push_back(c.id);
        } else if constexpr (std::is_same_v<T, MoveMultipleData>) {
          for (const MoveItem& item : data.items) ids.push_back(item.id);
        } else if constexpr (std::is_same_v<T, ReorderLayersData>) {
          for (const auto& entry : data.after) ids.push_back(entry.first);
        }
      },
      action.data);
  return ids;
}

}  // namespace internal
}  // namespace boardkit
