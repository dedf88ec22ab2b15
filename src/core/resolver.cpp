// src/core/resolver.cpp
#include "nick/core/resolver.hpp"

#include <system_error>

#include "nick/core/candidates.hpp"

namespace nick {
namespace fs = std::filesystem;

bool FilesystemProbe::is_regular_file(const fs::path& path) const {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && !ec;
}

std::optional<fs::path> first_existing_config(const FileProbe& probe,
                                              const std::vector<fs::path>& candidates) {
  for (const auto& candidate : candidates) {
    if (probe.is_regular_file(candidate)) return candidate;
  }
  return std::nullopt;
}

std::optional<fs::path> first_existing_config(const std::string& app) {
  return first_existing_config(FilesystemProbe{}, all_location_candidates(app));
}

}  // namespace nick
