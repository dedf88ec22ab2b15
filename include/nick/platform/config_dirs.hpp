// include/nick/platform/config_dirs.hpp
#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace nick {

// Environment variable lookup; std::nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

std::optional<std::string> process_env(const std::string& name);

// Ordered list of platform configuration roots, built step by step:
//
//   ConfigDirs::empty().add_platform_config_dir().add_root_etc().paths()
//
// Platform rules for add_platform_config_dir():
// - Linux / BSD: $XDG_CONFIG_HOME when set and absolute, else $HOME/.config
// - macOS:       $HOME/Library/Application Support
// - Windows:     %APPDATA%
// A root whose variables are missing is skipped, not an error.
class ConfigDirs {
 public:
  static ConfigDirs empty(EnvLookup env = process_env);

  ConfigDirs& add_platform_config_dir();

  // `/etc`; no-op on Windows.
  ConfigDirs& add_root_etc();

  ConfigDirs& add_path(std::filesystem::path path);

  [[nodiscard]] const std::vector<std::filesystem::path>& paths() const noexcept { return paths_; }

 private:
  explicit ConfigDirs(EnvLookup env);

  [[nodiscard]] std::optional<std::string> env(const std::string& name) const;

  EnvLookup env_;
  std::vector<std::filesystem::path> paths_;
};

// Per-user root followed by the system-wide root, from the process environment.
std::vector<std::filesystem::path> platform_config_roots();

}  // namespace nick
