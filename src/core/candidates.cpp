// src/core/candidates.cpp
#include "nick/core/candidates.hpp"

#include <system_error>

#include "nick/platform/config_dirs.hpp"

namespace nick {
namespace fs = std::filesystem;

std::optional<fs::path> current_working_dir() {
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (ec) return std::nullopt;
  return cwd;
}

std::vector<fs::path> expand_names(const fs::path& dir) {
  std::vector<fs::path> out;
  out.reserve(kConfigFileNames.size());
  for (const char* name : kConfigFileNames) out.push_back(dir / name);
  return out;
}

std::vector<fs::path> expand_path_and_names(const std::string& app, const fs::path& root) {
  return expand_names(app.empty() ? root : root / app);
}

std::vector<fs::path> all_location_candidates(const WorkingDirFn& working_dir,
                                              const std::vector<fs::path>& roots,
                                              const std::string& app) {
  std::vector<fs::path> out;
  out.reserve(kConfigFileNames.size() * (roots.size() + 1));

  // Project-local tier. An unknown working directory just drops the tier.
  if (working_dir) {
    if (const auto cwd = working_dir()) {
      for (auto& p : expand_names(*cwd / ("." + app))) out.push_back(std::move(p));
    }
  }

  // Platform tier.
  for (const auto& root : roots) {
    for (auto& p : expand_path_and_names(app, root)) out.push_back(std::move(p));
  }
  return out;
}

std::vector<fs::path> all_location_candidates(const std::string& app) {
  return all_location_candidates(current_working_dir, platform_config_roots(), app);
}

}  // namespace nick
