// src/platform/config_dirs.cpp
#include "nick/platform/config_dirs.hpp"

#include <cstdlib>
#include <utility>

namespace nick {
namespace fs = std::filesystem;

std::optional<std::string> process_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (raw == nullptr) return std::nullopt;
  return std::string{raw};
}

ConfigDirs::ConfigDirs(EnvLookup env) : env_(std::move(env)) {}

ConfigDirs ConfigDirs::empty(EnvLookup env) { return ConfigDirs(std::move(env)); }

std::optional<std::string> ConfigDirs::env(const std::string& name) const {
  if (!env_) return std::nullopt;
  auto value = env_(name);
  if (value && value->empty()) return std::nullopt;
  return value;
}

ConfigDirs& ConfigDirs::add_platform_config_dir() {
#if defined(_WIN32)
  if (const auto appdata = env("APPDATA")) paths_.emplace_back(*appdata);
#elif defined(__APPLE__)
  if (const auto home = env("HOME")) {
    paths_.push_back(fs::path(*home) / "Library" / "Application Support");
  }
#else
  if (const auto xdg = env("XDG_CONFIG_HOME"); xdg && fs::path(*xdg).is_absolute()) {
    paths_.emplace_back(*xdg);
  } else if (const auto home = env("HOME")) {
    paths_.push_back(fs::path(*home) / ".config");
  }
#endif
  return *this;
}

ConfigDirs& ConfigDirs::add_root_etc() {
#if !defined(_WIN32)
  paths_.emplace_back("/etc");
#endif
  return *this;
}

ConfigDirs& ConfigDirs::add_path(fs::path path) {
  paths_.push_back(std::move(path));
  return *this;
}

std::vector<fs::path> platform_config_roots() {
  return ConfigDirs::empty().add_platform_config_dir().add_root_etc().paths();
}

}  // namespace nick
