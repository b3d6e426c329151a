// Copyright 2026 The snapbridge Authors

#include "path/path_translator.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include "core/bridge_error.h"

namespace snapbridge {
namespace internal {

namespace {

constexpr char kWslHost[] = "\\\\wsl.localhost\\";
constexpr char kWslLegacyHost[] = "\\\\wsl$\\";

bool IsSeparator(char c) { return c == '/' || c == '\\'; }

std::string Replace(std::string s, char from, char to) {
  for (auto& c : s) {
    if (c == from) c = to;
  }
  return s;
}

bool StartsWithIgnoreCase(const std::string& s, const std::string& prefix) {
  if (s.size() < prefix.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(s[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

/// Collapse "//", "." and ".." in an absolute POSIX path.
std::string NormalizePosix(const std::string& path) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string::npos) next = path.size();
    std::string part = path.substr(pos, next - pos);
    if (part == "..") {
      if (!parts.empty()) parts.pop_back();
    } else if (!part.empty() && part != ".") {
      parts.push_back(std::move(part));
    }
    pos = next + 1;
  }
  std::string out;
  for (const auto& p : parts) out += "/" + p;
  return out.empty() ? "/" : out;
}

/// Components of `path` from offset `from` on, joined with `sep`, without
/// leading, trailing or doubled separators.
std::string JoinTail(const std::string& path, size_t from, char sep) {
  std::string out;
  bool pending = false;
  for (size_t i = from; i < path.size(); ++i) {
    if (IsSeparator(path[i])) {
      pending = !out.empty();
      continue;
    }
    if (pending) {
      out.push_back(sep);
      pending = false;
    }
    out.push_back(path[i]);
  }
  return out;
}

}  // namespace

PathTranslator::PathTranslator(std::string distro, std::string cwd)
    : distro_(std::move(distro)), cwd_(std::move(cwd)) {
  if (cwd_.empty() || cwd_[0] != '/') cwd_ = "/";
}

PathTranslator PathTranslator::FromEnvironment(
    const std::string& distro_override) {
  std::string distro = distro_override;
  if (distro.empty()) {
    const char* env = std::getenv("WSL_DISTRO_NAME");
    if (env) distro = env;
  }
  std::error_code ec;
  std::string cwd = std::filesystem::current_path(ec).string();
  if (ec) cwd = "/";
  return PathTranslator(std::move(distro), std::move(cwd));
}

bool PathTranslator::IsDrivePath(const std::string& path) {
  return path.size() >= 2 &&
         std::isalpha(static_cast<unsigned char>(path[0])) &&
         path[1] == ':' && (path.size() == 2 || IsSeparator(path[2]));
}

std::string PathTranslator::JoinPosix(const std::string& dir,
                                      const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

std::string PathTranslator::JoinWindows(const std::string& dir,
                                        const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '\\') return dir + name;
  return dir + "\\" + name;
}

std::string PathTranslator::MakeAbsolute(const std::string& path) const {
  if (!path.empty() && path[0] == '/') return NormalizePosix(path);
  return NormalizePosix(JoinPosix(cwd_, path));
}

std::string PathTranslator::ToWindows(const std::string& path) const {
  if (IsDrivePath(path)) {
    std::string out(1, static_cast<char>(
                           std::toupper(static_cast<unsigned char>(path[0]))));
    out += ":\\";
    out += JoinTail(path, 2, '\\');
    return out;
  }
  if (path.size() >= 2 && IsSeparator(path[0]) && IsSeparator(path[1]) &&
      path.find('\\') != std::string::npos) {
    return Replace(path, '/', '\\');  // Already a UNC path.
  }

  const std::string abs = MakeAbsolute(path);
  // /mnt/<d> or /mnt/<d>/...
  if (abs.size() >= 6 && abs.compare(0, 5, "/mnt/") == 0 &&
      std::isalpha(static_cast<unsigned char>(abs[5])) &&
      (abs.size() == 6 || abs[6] == '/')) {
    std::string out(1, static_cast<char>(
                           std::toupper(static_cast<unsigned char>(abs[5]))));
    out += ":\\";
    out += JoinTail(abs, 6, '\\');
    return out;
  }

  if (distro_.empty()) {
    throw BridgeError(kSnapBridgeErrorInvalidParam,
                      "Cannot map '" + abs +
                          "' to a Windows path: WSL distribution unknown "
                          "(set wsl_distro in settings.ini)");
  }
  std::string out = kWslHost + distro_;
  std::string tail = JoinTail(abs, 0, '\\');
  if (!tail.empty()) out += "\\" + tail;
  return out;
}

std::string PathTranslator::ToLocal(const std::string& path) const {
  if (IsDrivePath(path)) {
    std::string out = "/mnt/";
    out.push_back(static_cast<char>(
        std::tolower(static_cast<unsigned char>(path[0]))));
    std::string tail = JoinTail(path, 2, '/');
    if (!tail.empty()) out += "/" + tail;
    return out;
  }

  const std::string unc = Replace(path, '/', '\\');
  for (const char* host : {kWslHost, kWslLegacyHost}) {
    std::string prefix = std::string(host) + distro_;
    if (distro_.empty() || !StartsWithIgnoreCase(unc, prefix)) continue;
    if (unc.size() != prefix.size() && unc[prefix.size()] != '\\') continue;
    return NormalizePosix("/" + JoinTail(unc, prefix.size(), '/'));
  }
  return MakeAbsolute(path);
}

}  // namespace internal
}  // namespace snapbridge
