#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "nick/core/candidates.hpp"
#include "nick/platform/config_dirs.hpp"
#include "test_fixtures.hpp"

using namespace nick;
using std::filesystem::path;

TEST_CASE("expand_names yields both file names in order", "[candidates]") {
  const std::vector<path> expected{path("/tmp/config.ncl"), path("/tmp/config.nickel")};
  REQUIRE(expand_names(path("/tmp")) == expected);
}

TEST_CASE("expand_names on an empty path yields bare file names", "[candidates]") {
  const std::vector<path> expected{path("config.ncl"), path("config.nickel")};
  REQUIRE(expand_names(path()) == expected);
}

TEST_CASE("expand_path_and_names scopes the names under the app directory", "[candidates]") {
  SECTION("absolute root") {
    const std::vector<path> expected{path("/tmp/app/config.ncl"), path("/tmp/app/config.nickel")};
    REQUIRE(expand_path_and_names("app", path("/tmp")) == expected);
  }
  SECTION("blank app name uses the root itself") {
    const std::vector<path> expected{path("/tmp/config.ncl"), path("/tmp/config.nickel")};
    REQUIRE(expand_path_and_names("", path("/tmp")) == expected);
  }
  SECTION("empty root") {
    const std::vector<path> expected{path("app/config.ncl"), path("app/config.nickel")};
    REQUIRE(expand_path_and_names("app", path()) == expected);
  }
  SECTION("empty root and blank app name") {
    const std::vector<path> expected{path("config.ncl"), path("config.nickel")};
    REQUIRE(expand_path_and_names("", path()) == expected);
  }
}

TEST_CASE("all_location_candidates orders the project dotfile before platform roots",
          "[candidates]") {
  const WorkingDirFn pwd = []() -> std::optional<path> { return path("/projects/project_folder"); };
  const std::vector<path> roots{path("/home/testuser/.config"), path("/etc")};

  const std::vector<path> expected{
      path("/projects/project_folder/.some_app/config.ncl"),
      path("/projects/project_folder/.some_app/config.nickel"),
      path("/home/testuser/.config/some_app/config.ncl"),
      path("/home/testuser/.config/some_app/config.nickel"),
      path("/etc/some_app/config.ncl"),
      path("/etc/some_app/config.nickel"),
  };
  REQUIRE(all_location_candidates(pwd, roots, "some_app") == expected);
}

TEST_CASE("all_location_candidates drops the project tier when cwd is unknown", "[candidates]") {
  const WorkingDirFn pwd = []() -> std::optional<path> { return std::nullopt; };
  const std::vector<path> roots{path("/home/testuser/.config"), path("/etc")};

  const auto result = all_location_candidates(pwd, roots, "some_app");
  REQUIRE(result.size() == 4);
  CHECK(result.front() == path("/home/testuser/.config/some_app/config.ncl"));
  CHECK(result.back() == path("/etc/some_app/config.nickel"));
}

TEST_CASE("all_location_candidates with no roots only has the project tier", "[candidates]") {
  const WorkingDirFn pwd = []() -> std::optional<path> { return path("/work"); };
  const auto result = all_location_candidates(pwd, {}, "tool");
  const std::vector<path> expected{path("/work/.tool/config.ncl"), path("/work/.tool/config.nickel")};
  REQUIRE(result == expected);
}

#if !defined(_WIN32) && !defined(__APPLE__)
TEST_CASE("all_location_candidates follows the platform config dirs", "[candidates]") {
  const EnvLookup env = [](const std::string& name) -> std::optional<std::string> {
    if (name == "HOME") return std::string("/home/testuser");
    return std::nullopt;
  };
  const WorkingDirFn pwd = []() -> std::optional<path> { return path("/projects/project_folder"); };
  const auto roots = ConfigDirs::empty(env).add_platform_config_dir().add_root_etc().paths();

  const std::vector<path> expected{
      path("/projects/project_folder/.some_app/config.ncl"),
      path("/projects/project_folder/.some_app/config.nickel"),
      path("/home/testuser/.config/some_app/config.ncl"),
      path("/home/testuser/.config/some_app/config.nickel"),
      path("/etc/some_app/config.ncl"),
      path("/etc/some_app/config.nickel"),
  };
  REQUIRE(all_location_candidates(pwd, roots, "some_app") == expected);
}

TEST_CASE("all_location_candidates is wired to the process environment", "[candidates]") {
  test::ScopedEnv home("HOME", std::string("/home/testuser"));
  test::ScopedEnv xdg("XDG_CONFIG_HOME", std::nullopt);

  const auto result = all_location_candidates("some_app");
  REQUIRE(result.size() == 6);
  CHECK(result[2] == path("/home/testuser/.config/some_app/config.ncl"));
  CHECK(result[4] == path("/etc/some_app/config.ncl"));
}
#endif
