// include/nick/core/resolver.hpp
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nick {

// "Does this path denote an existing regular file?"
// Injected into resolution so probe order can be checked without real I/O.
class FileProbe {
 public:
  virtual ~FileProbe() = default;

  virtual bool is_regular_file(const std::filesystem::path& path) const = 0;
};

// Real filesystem. Errors (permissions, dangling links) count as "no file".
class FilesystemProbe final : public FileProbe {
 public:
  bool is_regular_file(const std::filesystem::path& path) const override;
};

// First candidate the probe accepts, in order. Stops at the first hit.
std::optional<std::filesystem::path> first_existing_config(
    const FileProbe& probe, const std::vector<std::filesystem::path>& candidates);

// all_location_candidates(app) probed against the real filesystem.
std::optional<std::filesystem::path> first_existing_config(const std::string& app);

}  // namespace nick
