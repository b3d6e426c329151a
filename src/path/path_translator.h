// Copyright 2026 The snapbridge Authors
//
// Translation between the caller's POSIX (WSL) path namespace and the
// drive-letter namespace the bridge writes files in.

#ifndef SNAPBRIDGE_PATH_PATH_TRANSLATOR_H_
#define SNAPBRIDGE_PATH_PATH_TRANSLATOR_H_

#include <string>

namespace snapbridge {
namespace internal {

class PathTranslator {
 public:
  /// `distro` names the WSL distribution for \\wsl.localhost paths; `cwd`
  /// anchors relative paths.
  PathTranslator(std::string distro, std::string cwd);

  /// Build a translator from $WSL_DISTRO_NAME (unless `distro_override` is
  /// non-empty) and the process working directory.
  static PathTranslator FromEnvironment(const std::string& distro_override);

  /// /mnt/c/x/y -> C:\x\y, C:/x -> C:\x, /home/u -> \\wsl.localhost\<distro>\home\u.
  std::string ToWindows(const std::string& path) const;

  /// C:\x\y -> /mnt/c/x/y, \\wsl.localhost\<distro>\p -> /p.  POSIX paths
  /// are returned absolute and unchanged otherwise.
  std::string ToLocal(const std::string& path) const;

  /// True for "C:\..." / "C:/..." / "C:".
  static bool IsDrivePath(const std::string& path);

  /// Join with a single '/' separator.
  static std::string JoinPosix(const std::string& dir, const std::string& name);

  /// Join with a single '\' separator.
  static std::string JoinWindows(const std::string& dir,
                                 const std::string& name);

  const std::string& distro() const { return distro_; }
  const std::string& cwd() const { return cwd_; }

 private:
  std::string MakeAbsolute(const std::string& path) const;

  std::string distro_;
  std::string cwd_;
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_PATH_PATH_TRANSLATOR_H_
