// Copyright 2026 The boardkit Authors

#include "core/board_context.h"

#include <utility>

#include "core/logger.h"
#include "render/render_adapter.h"
#include "render/scene_painter.h"

namespace boardkit {
namespace internal {

BoardContextImpl::BoardContextImpl()
    : history_(&scene_),
      snap_engine_(&scene_),
      controller_(&scene_, &selection_, &history_, &viewport_) {
  scene_.AddListener(this);
  selection_.SetChangeCallback([this]() {
    scene_.RequestRedraw();
    if (observer_.selection_changed) {
      observer_.selection_changed(observer_.userdata);
    }
  });
  controller_.SetObserver(this);
  controller_.SetSnapResolver(&snap_engine_);
  controller_.SetTextSurface(&text_surface_);
  ApplySettings();
  BOARDKIT_LOG_DEBUG("Board created");
}

BoardContextImpl::~BoardContextImpl() {
  controller_.SetObserver(nullptr);
  selection_.SetChangeCallback(nullptr);
  scene_.RemoveListener(this);
}

void BoardContextImpl::SetError(BoardKitError code,
                                const std::string& message) {
  last_error_ = code;
  last_error_message_ = message;
  BOARDKIT_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
}

void BoardContextImpl::ClearError() {
  last_error_ = kBoardKitOk;
  last_error_message_ = "No error";
}

// ---------------------------------------------------------------------------
// Observer
// ---------------------------------------------------------------------------

void BoardContextImpl::SetObserver(const BoardKitObserver* observer) {
  observer_ = observer ? *observer : BoardKitObserver{};
}

void BoardContextImpl::SetTextSurfaceCallbacks(
    const BoardKitTextSurfaceCallbacks* callbacks) {
  surface_callbacks_ = callbacks ? *callbacks : BoardKitTextSurfaceCallbacks{};

  BufferTextSurface::Placement placement;
  if (surface_callbacks_.open) {
    placement.open = [this](const std::string& id, const SurfaceRect& r) {
      surface_callbacks_.open(id.c_str(), r.x, r.y, r.width, r.height,
                              r.scale, surface_callbacks_.userdata);
    };
  }
  if (surface_callbacks_.reposition) {
    placement.reposition = [this](const SurfaceRect& r) {
      surface_callbacks_.reposition(r.x, r.y, r.width, r.height, r.scale,
                                    surface_callbacks_.userdata);
    };
  }
  if (surface_callbacks_.close) {
    placement.close = [this]() {
      surface_callbacks_.close(surface_callbacks_.userdata);
    };
  }
  text_surface_.SetPlacement(std::move(placement));
}

void BoardContextImpl::OnObjectsChanged() {
  if (observer_.objects_changed) observer_.objects_changed(observer_.userdata);
}

void BoardContextImpl::OnToolChanged(Tool tool) {
  if (observer_.tool_changed) {
    observer_.tool_changed(static_cast<BoardKitTool>(tool),
                           observer_.userdata);
  }
}

// ---------------------------------------------------------------------------
// Viewport
// ---------------------------------------------------------------------------

void BoardContextImpl::SetViewport(double zoom, double pan_x, double pan_y) {
  viewport_.SetZoom(zoom);
  viewport_.SetPan(pan_x, pan_y);
  ViewportChanged();
}

void BoardContextImpl::ZoomAt(double screen_x, double screen_y,
                              double factor) {
  viewport_.ZoomAt(screen_x, screen_y, factor);
  ViewportChanged();
}

void BoardContextImpl::PanBy(double dx, double dy) {
  viewport_.PanBy(dx, dy);
  ViewportChanged();
}

bool BoardContextImpl::FitToContent(int view_width, int view_height) {
  std::optional<Rect> content = scene_.ContentBounds();
  if (!content) return false;
  viewport_.FitToContent(*content, view_width, view_height);
  ViewportChanged();
  return true;
}

void BoardContextImpl::ViewportChanged() {
  snap_engine_.SetZoom(viewport_.zoom());
  controller_.OnViewportChanged();
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

void BoardContextImpl::ApplySettings() {
  snap_engine_.SetEnabled(settings_.enable_snapping);
  snap_engine_.SetSnapDistance(settings_.snap_threshold);
  snap_engine_.SetZoom(viewport_.zoom());
  controller_.SetSnappingEnabled(settings_.enable_snapping);
  history_.SetMaxHistory(settings_.max_history);

  ResizeLimits limits;
  limits.min_object_size = settings_.min_object_size;
  limits.min_palette_cell = settings_.min_palette_cell;
  limits.palette_resize_floor = settings_.palette_resize_floor;
  controller_.SetResizeLimits(limits);
  scene_.RequestRedraw();
}

bool BoardContextImpl::LoadSettings(const std::string& path) {
  const std::string resolved = path.empty() ? DefaultSettingsPath() : path;
  if (!settings_.LoadFromFile(resolved)) return false;
  if (std::optional<BoardKitLogLevel> level =
          ParseLogLevel(settings_.log_level)) {
    SetLogLevel(*level);
  }
  ApplySettings();
  BOARDKIT_LOG_INFO("Settings loaded from {}", resolved);
  return true;
}

bool BoardContextImpl::SaveSettings(const std::string& path) const {
  const std::string resolved = path.empty() ? DefaultSettingsPath() : path;
  return settings_.SaveToFile(resolved);
}

void BoardContextImpl::SetSnapping(bool enabled, double threshold) {
  settings_.enable_snapping = enabled;
  if (threshold >= 0) settings_.snap_threshold = threshold;
  ApplySettings();
}

void BoardContextImpl::SetMaxHistory(int max_history) {
  settings_.max_history = max_history;
  ApplySettings();
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

BoardKitError BoardContextImpl::RenderToBuffer(uint8_t* bgra, int width,
                                               int height, int stride) {
  auto adapter = CreateBufferRenderAdapter(bgra, width, height, stride);
  if (!adapter) {
    SetError(kBoardKitErrorNotSupported,
             "No raster render back-end in this build");
    return kBoardKitErrorNotSupported;
  }

  PaintFrame frame;
  frame.scene = &scene_;
  frame.selection = &selection_;
  frame.viewport = &viewport_;
  if (controller_.preview()) frame.preview = &controller_.preview()->object;
  frame.snap_guides = controller_.snap_guides();
  frame.box_selection = controller_.box_selection_rect();
  frame.show_grid = settings_.show_grid;
  frame.grid_size = settings_.grid_size;

  ScenePainter painter(adapter.get());
  if (!painter.Paint(frame)) {
    SetError(kBoardKitErrorUnknown, "Render back-end failed to start a frame");
    return kBoardKitErrorUnknown;
  }
  scene_.ConsumeRedraw();
  ClearError();
  return kBoardKitOk;
}

}  // namespace internal
}  // namespace boardkit
