// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_CORE_BOARD_SETTINGS_H_
#define BOARDKIT_CORE_BOARD_SETTINGS_H_

#include <string>

namespace boardkit {
namespace internal {

/// Board tunables, persisted as a flat key=value INI file.
struct BoardSettings {
  bool enable_snapping = true;
  double snap_threshold = 3.0;  // Screen pixels.
  bool show_grid = false;
  double grid_size = 50.0;
  int max_history = 50;
  double min_object_size = 50.0;
  double min_palette_cell = 20.0;
  double palette_resize_floor = 60.0;
  std::string log_level = "info";

  /// Read key=value pairs from path. A missing file leaves the current
  /// values untouched and returns false. Unknown keys and unparsable values
  /// are skipped with a warning.
  bool LoadFromFile(const std::string& path);

  /// Write every field to path, creating the parent directory if needed.
  bool SaveToFile(const std::string& path) const;

  /// Apply one key=value pair. Returns false for unknown keys or bad values.
  bool Set(const std::string& key, const std::string& value);
};

/// $XDG_CONFIG_HOME/boardkit/settings.ini, else ~/.config/boardkit/settings.ini.
std::string DefaultSettingsPath();

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_CORE_BOARD_SETTINGS_H_
