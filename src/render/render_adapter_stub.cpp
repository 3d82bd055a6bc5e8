// Copyright 2026 The boardkit Authors
// Fallback when no raster back-end is available.

#include "render/render_adapter.h"

namespace boardkit {
namespace internal {

std::unique_ptr<RenderAdapter> CreateBufferRenderAdapter(uint8_t* /*pixels*/,
                                                         int /*width*/,
                                                         int /*height*/,
                                                         int /*stride*/) {
  return nullptr;
}

}  // namespace internal
}  // namespace boardkit
