// Copyright 2026 The boardkit Authors
// Edge and centre alignment snapping for single-object drags.

#ifndef BOARDKIT_INTERACTION_SNAP_ENGINE_H_
#define BOARDKIT_INTERACTION_SNAP_ENGINE_H_

#include <utility>
#include <vector>

#include "geometry/geometry.h"
#include "scene/scene_model.h"
#include "scene/scene_object.h"

namespace boardkit {
namespace internal {

/// Alignment guide to draw while a snap is active.
struct SnapGuide {
  enum class Orientation { kVertical, kHorizontal };
  Orientation orientation;
  double position;  // World x for vertical guides, world y for horizontal.
};

/// Result of a snap attempt.
struct SnapResult {
  double x = 0.0;
  double y = 0.0;
  bool snapped_x = false;
  bool snapped_y = false;
  std::vector<SnapGuide> guides;
};

/// Adjusts a tentative drag position so the moving object lines up with
/// its neighbours. Returns the input unchanged when nothing is in range.
class SnapResolver {
 public:
  virtual ~SnapResolver() = default;

  virtual SnapResult Resolve(double tentative_x, double tentative_y,
                             const SceneObject& moving) = 0;
};

/// Snaps against visible scene objects and externally owned layers.
class SnapEngine : public SnapResolver {
 public:
  /// Does NOT take ownership of scene.
  explicit SnapEngine(const SceneModel* scene);

  void SetEnabled(bool enabled) { enabled_ = enabled; }
  bool enabled() const { return enabled_; }

  /// Snap distance in screen pixels (default 3). Negative values are ignored.
  void SetSnapDistance(double distance);
  double snap_distance() const { return snap_distance_; }

  /// Current zoom; the world threshold is snap_distance / zoom.
  void SetZoom(double zoom);

  /// Extra target rectangles (e.g. raster image layers).
  void SetExternalTargets(std::vector<Rect> targets) {
    external_targets_ = std::move(targets);
  }

  SnapResult Resolve(double tentative_x, double tentative_y,
                     const SceneObject& moving) override;

 private:
  const SceneModel* scene_;  // Non-owning
  bool enabled_ = true;
  double snap_distance_ = 3.0;
  double zoom_ = 1.0;
  std::vector<Rect> external_targets_;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_INTERACTION_SNAP_ENGINE_H_
