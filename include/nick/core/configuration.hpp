// include/nick/core/configuration.hpp
#pragma once

#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "nick/core/candidates.hpp"
#include "nick/core/loader.hpp"
#include "nick/core/resolver.hpp"
#include "nick/core/status.hpp"
#include "nick/platform/config_dirs.hpp"

namespace nick {

using ConfigRootsFn = std::function<std::vector<std::filesystem::path>()>;

// Where discovery looks. Defaults describe the running process; tests swap
// them out. Only consulted when no explicit path is given.
struct SearchPaths {
  WorkingDirFn working_dir = current_working_dir;
  ConfigRootsFn config_roots = platform_config_roots;
};

// The configuration source for `app`: the explicit path when given (not
// checked for existence), else the first existing candidate, else nothing.
std::optional<std::filesystem::path> resolve_config_source(
    const std::string& app, const std::optional<std::filesystem::path>& explicit_path,
    const FileProbe& probe, const SearchPaths& search);

std::optional<std::filesystem::path> resolve_config_source(
    const std::string& app, const std::optional<std::filesystem::path>& explicit_path);

// Loads the configuration of `app` into T.
//
// An explicit path always wins. Without one, the candidate locations are
// searched in order and the first existing file is loaded. When no file is
// found anywhere, the result is a default-constructed T: being unconfigured is
// not an error.
template <typename T>
Result<T> load_configuration(const std::string& app,
                             const std::optional<std::filesystem::path>& explicit_path,
                             const FileProbe& probe, const SearchPaths& search,
                             std::ostream& diagnostics) {
  const auto source = resolve_config_source(app, explicit_path, probe, search);
  if (!source) return Result<T>::ok(T{});
  return load<T>(*source, diagnostics);
}

template <typename T>
Result<T> load_configuration(const std::string& app,
                             const std::optional<std::filesystem::path>& explicit_path =
                                 std::nullopt) {
  return load_configuration<T>(app, explicit_path, FilesystemProbe{}, SearchPaths{}, std::cerr);
}

}  // namespace nick
