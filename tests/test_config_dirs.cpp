#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "nick/platform/config_dirs.hpp"

using namespace nick;
using std::filesystem::path;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> vars) {
  return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
    const auto it = vars.find(name);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}

}  // namespace

TEST_CASE("ConfigDirs starts empty", "[config_dirs]") {
  REQUIRE(ConfigDirs::empty(fake_env({})).paths().empty());
}

TEST_CASE("ConfigDirs keeps roots in the order they were added", "[config_dirs]") {
  const auto dirs = ConfigDirs::empty(fake_env({}))
                        .add_path("/opt/first")
                        .add_path("/opt/second")
                        .paths();
  const std::vector<path> expected{path("/opt/first"), path("/opt/second")};
  REQUIRE(dirs == expected);
}

#if !defined(_WIN32) && !defined(__APPLE__)
TEST_CASE("Platform config dir prefers an absolute XDG_CONFIG_HOME", "[config_dirs]") {
  const auto dirs = ConfigDirs::empty(fake_env({{"XDG_CONFIG_HOME", "/xdg"}, {"HOME", "/home/u"}}))
                        .add_platform_config_dir()
                        .paths();
  REQUIRE(dirs == std::vector<path>{path("/xdg")});
}

TEST_CASE("Platform config dir ignores a relative XDG_CONFIG_HOME", "[config_dirs]") {
  const auto dirs = ConfigDirs::empty(fake_env({{"XDG_CONFIG_HOME", "rel/xdg"}, {"HOME", "/home/u"}}))
                        .add_platform_config_dir()
                        .paths();
  REQUIRE(dirs == std::vector<path>{path("/home/u/.config")});
}

TEST_CASE("Platform config dir ignores empty variables", "[config_dirs]") {
  const auto dirs = ConfigDirs::empty(fake_env({{"XDG_CONFIG_HOME", ""}, {"HOME", ""}}))
                        .add_platform_config_dir()
                        .paths();
  REQUIRE(dirs.empty());
}

TEST_CASE("Platform config dir followed by /etc", "[config_dirs]") {
  const auto dirs = ConfigDirs::empty(fake_env({{"HOME", "/home/u"}}))
                        .add_platform_config_dir()
                        .add_root_etc()
                        .paths();
  const std::vector<path> expected{path("/home/u/.config"), path("/etc")};
  REQUIRE(dirs == expected);
}

TEST_CASE("Without HOME only /etc remains", "[config_dirs]") {
  const auto dirs =
      ConfigDirs::empty(fake_env({})).add_platform_config_dir().add_root_etc().paths();
  REQUIRE(dirs == std::vector<path>{path("/etc")});
}
#endif
