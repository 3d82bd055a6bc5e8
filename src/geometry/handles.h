// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_GEOMETRY_HANDLES_H_
#define BOARDKIT_GEOMETRY_HANDLES_H_

#include <optional>
#include <string>
#include <vector>

#include "geometry/geometry.h"
#include "scene/scene_object.h"

namespace boardkit {
namespace internal {

/// Resize handles. Box-like objects use the eight compass handles;
/// line/arrow use kStart and kEnd.
enum class HandleId { kNw, kN, kNe, kE, kSe, kS, kSw, kW, kStart, kEnd };

const char* HandleName(HandleId id);
std::optional<HandleId> HandleFromName(const std::string& name);

struct Handle {
  HandleId id;
  Point position;  // Unrotated object frame.
};

// Screen-space sizes, divided by zoom to get world units.
constexpr double kHandleRadius = 8.0;
constexpr double kRotationHandleOffset = 30.0;
constexpr double kRotationHandleHitRadius = 10.0;

inline double HandleHitRadius(double zoom) { return kHandleRadius / zoom; }

/// Hit threshold for line/arrow bodies: max(10, stroke_width + 5).
double LineHitThreshold(double stroke_width);

/// Resize handles of obj in its unrotated frame: eight for box-like
/// objects, two for line/arrow.
std::vector<Handle> HandlePositions(const SceneObject& obj);

/// World position of the rotation handle: 30 / zoom above the top-centre
/// of the object's bounds, rotated about the pivot with the object.
Point RotationHandlePosition(const SceneObject& obj, double zoom);

/// Map a world point into obj's unrotated frame.
Point ToObjectLocal(const SceneObject& obj, double x, double y);

/// Inverse of ToObjectLocal.
Point ToWorld(const SceneObject& obj, const Point& local);

/// Handle of obj under (x, y), or nullopt. The point is inverse-rotated
/// into the object's frame first.
std::optional<HandleId> HitResizeHandle(const SceneObject& obj, double x,
                                        double y, double zoom);

bool HitRotationHandle(const SceneObject& obj, double x, double y,
                       double zoom);

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_GEOMETRY_HANDLES_H_
