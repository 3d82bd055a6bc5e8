// Copyright 2026 The boardkit Authors
// Edge and centre alignment snapping implementation.

#include "interaction/snap_engine.h"

#include <cmath>
#include <limits>
#include <utility>

namespace boardkit {
namespace internal {

namespace {

// One axis of candidate matching: the moving box's edge at `moving`
// aligns with a target edge at `target`.
struct AxisCheck {
  double moving;
  double target;
};

struct AxisBest {
  double delta = 0.0;
  double distance = std::numeric_limits<double>::infinity();
  double guide = 0.0;
  bool found = false;
};

void Consider(const AxisCheck& check, double threshold, AxisBest* best) {
  double distance = std::fabs(check.moving - check.target);
  if (distance < threshold && distance < best->distance) {
    best->distance = distance;
    best->delta = check.target - check.moving;
    best->guide = check.target;
    best->found = true;
  }
}

void MatchTarget(const Rect& moving, const Rect& target, double threshold,
                 AxisBest* best_x, AxisBest* best_y) {
  const AxisCheck x_checks[] = {
      {moving.x, target.x},
      {moving.x, target.right()},
      {moving.right(), target.x},
      {moving.right(), target.right()},
      {moving.center().x, target.center().x},
  };
  for (const AxisCheck& c : x_checks) Consider(c, threshold, best_x);

  const AxisCheck y_checks[] = {
      {moving.y, target.y},
      {moving.y, target.bottom()},
      {moving.bottom(), target.y},
      {moving.bottom(), target.bottom()},
      {moving.center().y, target.center().y},
  };
  for (const AxisCheck& c : y_checks) Consider(c, threshold, best_y);
}

}  // namespace

SnapEngine::SnapEngine(const SceneModel* scene) : scene_(scene) {}

void SnapEngine::SetSnapDistance(double distance) {
  if (distance >= 0.0) {
    snap_distance_ = distance;
  }
}

void SnapEngine::SetZoom(double zoom) {
  if (zoom > 0.0) {
    zoom_ = zoom;
  }
}

SnapResult SnapEngine::Resolve(double tentative_x, double tentative_y,
                               const SceneObject& moving) {
  SnapResult result;
  result.x = tentative_x;
  result.y = tentative_y;
  if (!enabled_ || !scene_ || snap_distance_ <= 0.0) return result;

  double threshold = snap_distance_ / zoom_;

  // Bounds of the moving object at the tentative position.
  Rect box = ObjectBounds(moving);
  box.x += tentative_x - moving.x;
  box.y += tentative_y - moving.y;

  AxisBest best_x;
  AxisBest best_y;
  for (const Rect& target : external_targets_) {
    MatchTarget(box, target, threshold, &best_x, &best_y);
  }
  for (const SceneObject* obj : scene_->ObjectsByZOrder()) {
    if (obj->id == moving.id || !obj->visible) continue;
    MatchTarget(box, ObjectBounds(*obj), threshold, &best_x, &best_y);
  }

  if (best_x.found) {
    result.x += best_x.delta;
    result.snapped_x = true;
    result.guides.push_back({SnapGuide::Orientation::kVertical, best_x.guide});
  }
  if (best_y.found) {
    result.y += best_y.delta;
    result.snapped_y = true;
    result.guides.push_back(
        {SnapGuide::Orientation::kHorizontal, best_y.guide});
  }
  return result;
}

}  // namespace internal
}  // namespace boardkit
