#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "nick/core/configuration.hpp"
#include "test_fixtures.hpp"

using namespace nick;
using std::filesystem::path;
using test::TestConfiguration;

namespace {

class CountingProbe final : public FileProbe {
 public:
  bool is_regular_file(const path&) const override {
    ++calls;
    return false;
  }

  mutable int calls = 0;
};

SearchPaths nowhere() {
  SearchPaths search;
  search.working_dir = []() -> std::optional<path> { return std::nullopt; };
  search.config_roots = []() { return std::vector<path>{}; };
  return search;
}

}  // namespace

TEST_CASE("An explicit path bypasses discovery", "[configuration]") {
  CountingProbe probe;
  int roots_calls = 0;
  SearchPaths search = nowhere();
  search.config_roots = [&roots_calls]() {
    ++roots_calls;
    return std::vector<path>{path("/etc")};
  };

  const auto source =
      resolve_config_source("some_app", path("/nonexistent/explicit.ncl"), probe, search);
  REQUIRE(source == path("/nonexistent/explicit.ncl"));
  CHECK(probe.calls == 0);
  CHECK(roots_calls == 0);
}

TEST_CASE("Discovery returns the first existing candidate", "[configuration]") {
  test::TempDir cwd;
  test::TempDir root;
  const auto in_root = root.write("some_app/config.ncl", "{}");

  SearchPaths search;
  search.working_dir = [&cwd]() -> std::optional<path> { return cwd.path(); };
  search.config_roots = [&root]() { return std::vector<path>{root.path()}; };

  REQUIRE(resolve_config_source("some_app", std::nullopt, FilesystemProbe{}, search) == in_root);

  // The project dotfile takes precedence once it exists.
  const auto dotfile = cwd.write(".some_app/config.nickel", "{}");
  REQUIRE(resolve_config_source("some_app", std::nullopt, FilesystemProbe{}, search) == dotfile);
}

TEST_CASE("Nothing found resolves to no source", "[configuration]") {
  CountingProbe probe;
  CHECK_FALSE(resolve_config_source("some_app", std::nullopt, probe, nowhere()).has_value());
  CHECK_FALSE(resolve_config_source("this_app_does_not_exist", std::nullopt).has_value());
}

TEST_CASE("load_configuration defaults when nothing is found", "[configuration]") {
  std::ostringstream diag;
  auto r = load_configuration<TestConfiguration>("some_app", std::nullopt, FilesystemProbe{},
                                                 nowhere(), diag);
  REQUIRE(r.ok());
  CHECK(r.value() == TestConfiguration{});

  auto unknown = load_configuration<TestConfiguration>("this_app_does_not_exist");
  REQUIRE(unknown.ok());
  CHECK(unknown->test_value.empty());
}

TEST_CASE("load_configuration loads an explicit path", "[configuration]") {
  test::TempDir dir;
  const auto file = dir.write("elsewhere.ncl", test::kNickRecord);

  auto r = load_configuration<TestConfiguration>("some_app", file);
  REQUIRE(r.ok());
  CHECK(r->test_value == "nick");
}

TEST_CASE("An explicit path wins over an existing discovered file", "[configuration]") {
  test::TempDir root;
  const auto discovered = root.write("some_app/config.ncl", R"({ test_value = "discovered" })");
  test::TempDir elsewhere;
  const auto explicit_file = elsewhere.write("explicit.ncl", R"({ test_value = "explicit" })");

  SearchPaths search = nowhere();
  search.config_roots = [&root]() { return std::vector<path>{root.path()}; };

  std::ostringstream diag;
  REQUIRE(resolve_config_source("some_app", std::nullopt, FilesystemProbe{}, search) ==
          discovered);

  auto r = load_configuration<TestConfiguration>("some_app", explicit_file, FilesystemProbe{},
                                                 search, diag);
  REQUIRE(r.ok());
  CHECK(r->test_value == "explicit");
}

TEST_CASE("load_configuration reports a missing explicit path", "[configuration]") {
  test::TempDir dir;
  std::ostringstream diag;
  auto r = load_configuration<TestConfiguration>("some_app", dir.path() / "absent.ncl",
                                                 FilesystemProbe{}, nowhere(), diag);
  REQUIRE_FALSE(r.ok());
  CHECK(r.error().kind() == Error::Kind::kReadFailure);
}

TEST_CASE("load_configuration surfaces errors from a discovered file", "[configuration]") {
  test::TempDir root;
  root.write("some_app/config.ncl", "{ test_value = ");

  SearchPaths search = nowhere();
  search.config_roots = [&root]() { return std::vector<path>{root.path()}; };

  std::ostringstream diag;
  auto r = load_configuration<TestConfiguration>("some_app", std::nullopt, FilesystemProbe{},
                                                 search, diag);
  REQUIRE_FALSE(r.ok());
  CHECK(r.error().kind() == Error::Kind::kEvaluationFailure);
  CHECK_FALSE(diag.str().empty());
}

#if !defined(_WIN32) && !defined(__APPLE__)
TEST_CASE("load_configuration discovers a file under XDG_CONFIG_HOME", "[configuration]") {
  test::TempDir xdg;
  xdg.write("some_app/config.ncl", test::kNickRecord);
  test::ScopedEnv env("XDG_CONFIG_HOME", xdg.path().string());

  auto r = load_configuration<TestConfiguration>("some_app");
  REQUIRE(r.ok());
  CHECK(r.value() == TestConfiguration{"nick"});
}

TEST_CASE("An explicit path wins over a file under XDG_CONFIG_HOME", "[configuration]") {
  test::TempDir xdg;
  xdg.write("some_app/config.ncl", test::kNickRecord);
  test::ScopedEnv env("XDG_CONFIG_HOME", xdg.path().string());

  test::TempDir elsewhere;
  const auto explicit_file = elsewhere.write("explicit.ncl", R"({ test_value = "explicit" })");

  REQUIRE(load_configuration<TestConfiguration>("some_app")->test_value == "nick");

  auto r = load_configuration<TestConfiguration>("some_app", explicit_file);
  REQUIRE(r.ok());
  CHECK(r->test_value == "explicit");
}

TEST_CASE("config.ncl wins over config.nickel in the same directory", "[configuration]") {
  test::TempDir xdg;
  xdg.write("some_app/config.nickel", R"({ test_value = "nickel" })");
  xdg.write("some_app/config.ncl", R"({ test_value = "ncl" })");
  test::ScopedEnv env("XDG_CONFIG_HOME", xdg.path().string());

  auto r = load_configuration<TestConfiguration>("some_app");
  REQUIRE(r.ok());
  CHECK(r->test_value == "ncl");
}
#endif
