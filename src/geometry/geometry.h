// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_GEOMETRY_GEOMETRY_H_
#define BOARDKIT_GEOMETRY_GEOMETRY_H_

namespace boardkit {
namespace internal {

constexpr double kPi = 3.14159265358979323846;

/// A point in world or screen space.
struct Point {
  double x = 0.0;
  double y = 0.0;
};

/// Axis-aligned rectangle (top-left origin, non-negative extent).
struct Rect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  double right() const { return x + width; }
  double bottom() const { return y + height; }
  Point center() const { return {x + width / 2.0, y + height / 2.0}; }
};

inline double DegreesToRadians(double degrees) { return degrees * kPi / 180.0; }
inline double RadiansToDegrees(double radians) { return radians * 180.0 / kPi; }

/// Inclusive bounds test: x <= px <= x + w and y <= py <= y + h.
bool PointInAxisAlignedBox(double px, double py, const Rect& box);

/// Distance from (px, py) to the segment (x1, y1)-(x2, y2), with the
/// projection clamped to the segment. Degenerate segments measure to the
/// single point.
double PointToSegmentDistance(double px, double py, double x1, double y1,
                              double x2, double y2);

/// Rotate (px, py) around (cx, cy) by angle_degrees (clockwise in a y-down
/// coordinate system).
Point RotatePointAroundCenter(double px, double py, double cx, double cy,
                              double angle_degrees);

/// Box spanned by two corner points in any order.
Rect NormalizedRect(const Point& a, const Point& b);

/// True if the two rectangles overlap (touching edges count).
bool RectsIntersect(const Rect& a, const Rect& b);

/// Smallest rectangle containing both inputs.
Rect UnionRect(const Rect& a, const Rect& b);

double Distance(const Point& a, const Point& b);

// ---------------------------------------------------------------------------
// Viewport (world <-> screen mapping)
// ---------------------------------------------------------------------------

/// Pan/zoom state of the canvas. screen = world * zoom + pan.
class Viewport {
 public:
  static constexpr double kMinZoom = 0.05;
  static constexpr double kMaxZoom = 20.0;

  double zoom() const { return zoom_; }
  double pan_x() const { return pan_x_; }
  double pan_y() const { return pan_y_; }

  Point ScreenToWorld(double sx, double sy) const;
  Point WorldToScreen(double wx, double wy) const;

  /// Multiply the zoom by factor, keeping the world point under
  /// (screen_x, screen_y) fixed.
  void ZoomAt(double screen_x, double screen_y, double factor);

  void SetZoom(double zoom);
  void SetPan(double pan_x, double pan_y);
  void PanBy(double dx, double dy);
  void Reset();

  /// Fit the content rectangle into a view_width x view_height view with
  /// padding on every side. Empty content leaves the viewport unchanged.
  void FitToContent(const Rect& content, double view_width, double view_height,
                    double padding = 50.0);

 private:
  double zoom_ = 1.0;
  double pan_x_ = 0.0;
  double pan_y_ = 0.0;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_GEOMETRY_GEOMETRY_H_
