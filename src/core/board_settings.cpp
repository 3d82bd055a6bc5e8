// Copyright 2026 The boardkit Authors

#include "core/board_settings.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>

#include "core/logger.h"

namespace boardkit {
namespace internal {

namespace {

std::string Trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

bool ParseBool(const std::string& value, bool* out) {
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    *out = true;
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseDouble(const std::string& value, double* out) {
  if (value.empty()) return false;
  char* end = nullptr;
  errno = 0;
  double v = std::strtod(value.c_str(), &end);
  if (errno != 0 || !end || *end != '\0') return false;
  *out = v;
  return true;
}

bool ParseInt(const std::string& value, int* out) {
  if (value.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(value.c_str(), &end, 10);
  if (errno != 0 || !end || *end != '\0') return false;
  *out = static_cast<int>(v);
  return true;
}

std::string ParentDir(const std::string& path) {
  size_t slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return "";
  return path.substr(0, slash);
}

}  // namespace

bool BoardSettings::Set(const std::string& key, const std::string& value) {
  if (key == "enable_snapping") return ParseBool(value, &enable_snapping);
  if (key == "show_grid") return ParseBool(value, &show_grid);

  double d = 0.0;
  if (key == "snap_threshold") {
    if (!ParseDouble(value, &d) || d < 0.0) return false;
    snap_threshold = d;
    return true;
  }
  if (key == "grid_size") {
    if (!ParseDouble(value, &d) || d <= 0.0) return false;
    grid_size = d;
    return true;
  }
  if (key == "min_object_size") {
    if (!ParseDouble(value, &d) || d <= 0.0) return false;
    min_object_size = d;
    return true;
  }
  if (key == "min_palette_cell") {
    if (!ParseDouble(value, &d) || d <= 0.0) return false;
    min_palette_cell = d;
    return true;
  }
  if (key == "palette_resize_floor") {
    if (!ParseDouble(value, &d) || d <= 0.0) return false;
    palette_resize_floor = d;
    return true;
  }
  if (key == "max_history") {
    int n = 0;
    if (!ParseInt(value, &n) || n < 1) return false;
    max_history = n;
    return true;
  }
  if (key == "log_level") {
    if (!ParseLogLevel(value)) return false;
    log_level = value;
    return true;
  }
  return false;
}

bool BoardSettings::LoadFromFile(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    BOARDKIT_LOG_DEBUG("Settings file {} not found, using defaults", path);
    return false;
  }

  std::string line;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    line = Trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[')
      continue;
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      BOARDKIT_LOG_WARN("{}:{}: expected key=value", path, line_no);
      continue;
    }
    std::string key = Trim(line.substr(0, eq));
    std::string value = Trim(line.substr(eq + 1));
    if (!Set(key, value)) {
      BOARDKIT_LOG_WARN("{}:{}: ignoring setting {}={}", path, line_no, key,
                        value);
    }
  }
  return true;
}

bool BoardSettings::SaveToFile(const std::string& path) const {
  std::string dir = ParentDir(path);
  if (!dir.empty()) {
    std::string parent = ParentDir(dir);
    if (!parent.empty()) mkdir(parent.c_str(), 0755);
    mkdir(dir.c_str(), 0755);
  }

  std::ofstream f(path);
  if (!f) {
    BOARDKIT_LOG_WARN("Cannot write settings file {}", path);
    return false;
  }
  f << "[Board]\n";
  f << "enable_snapping=" << (enable_snapping ? "true" : "false") << "\n";
  f << "snap_threshold=" << snap_threshold << "\n";
  f << "show_grid=" << (show_grid ? "true" : "false") << "\n";
  f << "grid_size=" << grid_size << "\n";
  f << "max_history=" << max_history << "\n";
  f << "min_object_size=" << min_object_size << "\n";
  f << "min_palette_cell=" << min_palette_cell << "\n";
  f << "palette_resize_floor=" << palette_resize_floor << "\n";
  f << "log_level=" << log_level << "\n";
  return f.good();
}

std::string DefaultSettingsPath() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  std::string base;
  if (xdg && xdg[0]) {
    base = xdg;
  } else {
    const char* home = std::getenv("HOME");
    base = home ? std::string(home) + "/.config" : "/tmp";
  }
  return base + "/boardkit/settings.ini";
}

}  // namespace internal
}  // namespace boardkit
