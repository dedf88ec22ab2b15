// src/core/configuration.cpp
#include "nick/core/configuration.hpp"

namespace nick {
namespace fs = std::filesystem;

std::optional<fs::path> resolve_config_source(const std::string& app,
                                              const std::optional<fs::path>& explicit_path,
                                              const FileProbe& probe, const SearchPaths& search) {
  if (explicit_path) return explicit_path;

  const std::vector<fs::path> roots =
      search.config_roots ? search.config_roots() : std::vector<fs::path>{};
  return first_existing_config(probe, all_location_candidates(search.working_dir, roots, app));
}

std::optional<fs::path> resolve_config_source(const std::string& app,
                                              const std::optional<fs::path>& explicit_path) {
  return resolve_config_source(app, explicit_path, FilesystemProbe{}, SearchPaths{});
}

}  // namespace nick
