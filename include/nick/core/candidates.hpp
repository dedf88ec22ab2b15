// include/nick/core/candidates.hpp
#pragma once

#include <array>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace nick {

// Accepted file names, probed in this order in every directory.
inline constexpr std::array<const char*, 2> kConfigFileNames = {"config.ncl", "config.nickel"};

// Working directory source; std::nullopt when it cannot be determined.
using WorkingDirFn = std::function<std::optional<std::filesystem::path>()>;

std::optional<std::filesystem::path> current_working_dir();

// [dir/config.ncl, dir/config.nickel]
std::vector<std::filesystem::path> expand_names(const std::filesystem::path& dir);

// expand_names(root/app); an empty app expands root itself.
std::vector<std::filesystem::path> expand_path_and_names(const std::string& app,
                                                         const std::filesystem::path& root);

// Every place a configuration for `app` may live, highest precedence first:
//   <cwd>/.<app>/config.{ncl,nickel}          (omitted if cwd is unknown)
//   <root>/<app>/config.{ncl,nickel}           for each root, in order
std::vector<std::filesystem::path> all_location_candidates(
    const WorkingDirFn& working_dir, const std::vector<std::filesystem::path>& roots,
    const std::string& app);

// Same, using the process working directory and platform_config_roots().
std::vector<std::filesystem::path> all_location_candidates(const std::string& app);

}  // namespace nick
