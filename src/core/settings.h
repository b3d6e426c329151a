// Copyright 2026 The snapbridge Authors
//
// Settings read from $XDG_CONFIG_HOME/snapbridge/settings.ini.

#ifndef SNAPBRIDGE_CORE_SETTINGS_H_
#define SNAPBRIDGE_CORE_SETTINGS_H_

#include <cstddef>
#include <string>

namespace snapbridge {
namespace internal {

struct Settings {
  std::string bridge_program = "powershell.exe";
  int timeout_ms = 60000;                    ///< 0 disables the timeout
  size_t max_output_bytes = 50 * 1024 * 1024;
  int settle_delay_ms = 200;
  std::string default_folder;                ///< Empty: <cwd>/screenshots
  std::string wsl_distro;                    ///< Empty: $WSL_DISTRO_NAME
  std::string log_level;                     ///< Empty: keep the current level

  /// Load from `path`.  A missing file yields the defaults.  Unknown keys
  /// are ignored; malformed numbers keep the default with a warning.
  static Settings LoadFromFile(const std::string& path);

  /// Load from the per-user settings file.
  static Settings LoadDefault();

  /// $XDG_CONFIG_HOME/snapbridge/settings.ini (or ~/.config/...).
  static std::string DefaultPath();
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CORE_SETTINGS_H_
