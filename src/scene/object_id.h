// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_SCENE_OBJECT_ID_H_
#define BOARDKIT_SCENE_OBJECT_ID_H_

#include <string>

namespace boardkit {
namespace internal {

/// Generate a new object id of the form "obj_<unix-ms>_<9 base36 chars>".
/// Thread-safe.
std::string GenerateObjectId();

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_SCENE_OBJECT_ID_H_
