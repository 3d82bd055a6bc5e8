// Copyright 2026 The boardkit Authors

#include "geometry/geometry.h"

#include <algorithm>
#include <cmath>

namespace boardkit {
namespace internal {

bool PointInAxisAlignedBox(double px, double py, const Rect& box) {
  return px >= box.x && px <= box.x + box.width && py >= box.y &&
         py <= box.y + box.height;
}

double PointToSegmentDistance(double px, double py, double x1, double y1,
                              double x2, double y2) {
  double dx = x2 - x1;
  double dy = y2 - y1;
  double length_sq = dx * dx + dy * dy;

  double t = 0.0;
  if (length_sq > 0.0) {
    t = ((px - x1) * dx + (py - y1) * dy) / length_sq;
    t = (std::max)(0.0, (std::min)(1.0, t));
  }

  double nearest_x = x1 + t * dx;
  double nearest_y = y1 + t * dy;
  return std::hypot(px - nearest_x, py - nearest_y);
}

Point RotatePointAroundCenter(double px, double py, double cx, double cy,
                              double angle_degrees) {
  double rad = DegreesToRadians(angle_degrees);
  double cos_a = std::cos(rad);
  double sin_a = std::sin(rad);
  double dx = px - cx;
  double dy = py - cy;
  return {cx + dx * cos_a - dy * sin_a, cy + dx * sin_a + dy * cos_a};
}

Rect NormalizedRect(const Point& a, const Point& b) {
  Rect r;
  r.x = (std::min)(a.x, b.x);
  r.y = (std::min)(a.y, b.y);
  r.width = std::fabs(b.x - a.x);
  r.height = std::fabs(b.y - a.y);
  return r;
}

bool RectsIntersect(const Rect& a, const Rect& b) {
  return a.x <= b.right() && a.right() >= b.x && a.y <= b.bottom() &&
         a.bottom() >= b.y;
}

Rect UnionRect(const Rect& a, const Rect& b) {
  double left = (std::min)(a.x, b.x);
  double top = (std::min)(a.y, b.y);
  double right = (std::max)(a.right(), b.right());
  double bottom = (std::max)(a.bottom(), b.bottom());
  return {left, top, right - left, bottom - top};
}

double Distance(const Point& a, const Point& b) {
  return std::hypot(b.x - a.x, b.y - a.y);
}

// ---------------------------------------------------------------------------
// Viewport
// ---------------------------------------------------------------------------

Point Viewport::ScreenToWorld(double sx, double sy) const {
  return {(sx - pan_x_) / zoom_, (sy - pan_y_) / zoom_};
}

Point Viewport::WorldToScreen(double wx, double wy) const {
  return {wx * zoom_ + pan_x_, wy * zoom_ + pan_y_};
}

void Viewport::ZoomAt(double screen_x, double screen_y, double factor) {
  if (!(factor > 0.0)) return;
  Point anchor = ScreenToWorld(screen_x, screen_y);
  SetZoom(zoom_ * factor);
  pan_x_ = screen_x - anchor.x * zoom_;
  pan_y_ = screen_y - anchor.y * zoom_;
}

void Viewport::SetZoom(double zoom) {
  if (!std::isfinite(zoom)) return;
  zoom_ = (std::max)(kMinZoom, (std::min)(kMaxZoom, zoom));
}

void Viewport::SetPan(double pan_x, double pan_y) {
  pan_x_ = pan_x;
  pan_y_ = pan_y;
}

void Viewport::PanBy(double dx, double dy) {
  pan_x_ += dx;
  pan_y_ += dy;
}

void Viewport::Reset() {
  zoom_ = 1.0;
  pan_x_ = 0.0;
  pan_y_ = 0.0;
}

void Viewport::FitToContent(const Rect& content, double view_width,
                            double view_height, double padding) {
  if (content.width <= 0.0 || content.height <= 0.0) return;
  double zoom_x = (view_width - padding * 2.0) / content.width;
  double zoom_y = (view_height - padding * 2.0) / content.height;
  SetZoom((std::min)(zoom_x, zoom_y));

  Point c = content.center();
  pan_x_ = view_width / 2.0 - c.x * zoom_;
  pan_y_ = view_height / 2.0 - c.y * zoom_;
}

}  // namespace internal
}  // namespace boardkit
