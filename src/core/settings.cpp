// Copyright 2026 The snapbridge Authors

#include "core/settings.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>

#include "core/logger.h"

namespace snapbridge {
namespace internal {

namespace {

std::string Trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return std::string();
  size_t end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

bool ParseNonNegative(const std::string& text, long long* out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0' || v < 0) return false;
  *out = v;
  return true;
}

void ApplyInt(const std::string& key, const std::string& value, int* field) {
  long long v = 0;
  if (!ParseNonNegative(value, &v) || v > 0x7FFFFFFF) {
    SNAPBRIDGE_LOG_WARN("Ignoring invalid value for {}: '{}'", key, value);
    return;
  }
  *field = static_cast<int>(v);
}

}  // namespace

// static
Settings Settings::LoadFromFile(const std::string& path) {
  Settings settings;
  std::ifstream f(path);
  if (!f) {
    SNAPBRIDGE_LOG_DEBUG("No settings file at {}, using defaults", path);
    return settings;
  }

  std::string line;
  while (std::getline(f, line)) {
    line = Trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
      continue;
    }
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = Trim(line.substr(0, eq));
    std::string val = Trim(line.substr(eq + 1));

    if (key == "bridge_program") {
      if (!val.empty()) settings.bridge_program = val;
    } else if (key == "timeout_ms") {
      ApplyInt(key, val, &settings.timeout_ms);
    } else if (key == "settle_delay_ms") {
      ApplyInt(key, val, &settings.settle_delay_ms);
    } else if (key == "max_output_bytes") {
      long long v = 0;
      if (ParseNonNegative(val, &v) && v > 0) {
        settings.max_output_bytes = static_cast<size_t>(v);
      } else {
        SNAPBRIDGE_LOG_WARN("Ignoring invalid value for {}: '{}'", key, val);
      }
    } else if (key == "default_folder") {
      settings.default_folder = val;
    } else if (key == "wsl_distro") {
      settings.wsl_distro = val;
    } else if (key == "log_level") {
      settings.log_level = val;
    } else {
      SNAPBRIDGE_LOG_DEBUG("Unknown settings key '{}'", key);
    }
  }
  return settings;
}

// static
Settings Settings::LoadDefault() { return LoadFromFile(DefaultPath()); }

// static
std::string Settings::DefaultPath() {
  std::string base;
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && xdg[0]) {
    base = xdg;
  } else {
    const char* home = std::getenv("HOME");
    base = home ? std::string(home) + "/.config" : "/tmp";
  }
  return base + "/snapbridge/settings.ini";
}

}  // namespace internal
}  // namespace snapbridge
