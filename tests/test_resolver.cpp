#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "nick/core/resolver.hpp"
#include "test_fixtures.hpp"

using namespace nick;
using std::filesystem::path;

namespace {

// Treats any path whose name ends in "_file" as an existing file and
// remembers what it was asked about.
class SuffixProbe final : public FileProbe {
 public:
  bool is_regular_file(const path& p) const override {
    asked.push_back(p);
    const std::string s = p.string();
    const std::string suffix = "_file";
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

  mutable std::vector<path> asked;
};

class SetProbe final : public FileProbe {
 public:
  explicit SetProbe(std::set<path> files) : files_(std::move(files)) {}
  bool is_regular_file(const path& p) const override { return files_.count(p) > 0; }

 private:
  std::set<path> files_;
};

}  // namespace

TEST_CASE("first_existing_config returns the only existing candidate", "[resolver]") {
  SuffixProbe probe;
  const std::vector<path> candidates{path("file_is_not"), path("the_actual_file")};
  REQUIRE(first_existing_config(probe, candidates) == path("the_actual_file"));
}

TEST_CASE("first_existing_config ignores later matches", "[resolver]") {
  SuffixProbe probe;
  const std::vector<path> candidates{path("file_is_not"), path("the_actual_file"),
                                     path("not_the_first_file")};

  REQUIRE(first_existing_config(probe, candidates) == path("the_actual_file"));
  // Stops probing after the hit.
  REQUIRE(probe.asked.size() == 2);
}

TEST_CASE("first_existing_config returns nothing when no candidate exists", "[resolver]") {
  const SetProbe probe({path("/elsewhere/config.ncl")});
  const std::vector<path> candidates{path("/a/config.ncl"), path("/a/config.nickel")};
  REQUIRE_FALSE(first_existing_config(probe, candidates).has_value());
}

TEST_CASE("first_existing_config on an empty candidate list", "[resolver]") {
  SuffixProbe probe;
  REQUIRE_FALSE(first_existing_config(probe, {}).has_value());
  REQUIRE(probe.asked.empty());
}

TEST_CASE("first_existing_config for an unknown app finds nothing", "[resolver]") {
  REQUIRE_FALSE(first_existing_config("this_app_does_not_exist").has_value());
}

TEST_CASE("FilesystemProbe only accepts regular files", "[resolver]") {
  test::TempDir dir;
  const path file = dir.write("app/config.ncl", "{}");

  FilesystemProbe probe;
  CHECK(probe.is_regular_file(file));
  CHECK_FALSE(probe.is_regular_file(dir.path() / "app"));
  CHECK_FALSE(probe.is_regular_file(dir.path() / "app" / "config.nickel"));
}

TEST_CASE("A directory named like a config file is skipped", "[resolver]") {
  test::TempDir dir;
  std::filesystem::create_directories(dir.path() / "config.ncl");
  const path real = dir.write("config.nickel", "{}");

  const std::vector<path> candidates{dir.path() / "config.ncl", real};
  REQUIRE(first_existing_config(FilesystemProbe{}, candidates) == real);
}
