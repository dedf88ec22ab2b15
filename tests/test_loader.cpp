#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch.hpp>
#include <yaml-cpp/yaml.h>

#include "nick/core/loader.hpp"
#include "test_fixtures.hpp"

using namespace nick;
using test::TestConfiguration;

namespace {

struct Server {
  std::string host;
  int port = 80;
  std::vector<std::string> tags;
};

struct Port {
  int port = 0;
};

}  // namespace

namespace YAML {
template <>
struct convert<Server> {
  static bool decode(const Node& node, Server& s) {
    nick::FieldReader r(node);
    r.required("host", s.host);
    r.optional("port", s.port);
    r.optional("tags", s.tags);
    return true;
  }
};

template <>
struct convert<Port> {
  static bool decode(const Node& node, Port& p) {
    nick::FieldReader r(node);
    r.required("port", p.port);
    return true;
  }
};
}  // namespace YAML

TEST_CASE("load decodes a well-formed configuration", "[loader]") {
  test::TempDir dir;
  const auto file = dir.write("config.ncl", test::kNickRecord);

  std::ostringstream diag;
  auto r = load<TestConfiguration>(file, diag);
  REQUIRE(r.ok());
  CHECK(r.value() == TestConfiguration{"nick"});
  CHECK(diag.str().empty());
}

TEST_CASE("load fills optional fields and keeps defaults", "[loader]") {
  test::TempDir dir;
  const auto file = dir.write("server.ncl", R"(
    let defaults = { port | default = 8080 } in
    defaults & { host = "example.org", tags = ["a", "b"] }
  )");

  std::ostringstream diag;
  auto r = load<Server>(file, diag);
  REQUIRE(r.ok());
  CHECK(r->host == "example.org");
  CHECK(r->port == 8080);
  CHECK(r->tags == std::vector<std::string>{"a", "b"});
}

TEST_CASE("load into generic shapes", "[loader]") {
  test::TempDir dir;
  const auto file = dir.write("env.ncl", R"({ A = "1", B = "two" })");

  std::ostringstream diag;
  auto r = load<std::map<std::string, std::string>>(file, diag);
  REQUIRE(r.ok());
  CHECK(r->at("B") == "two");

  auto tree = load<YAML::Node>(file, diag);
  REQUIRE(tree.ok());
  CHECK(tree->IsMap());
}

TEST_CASE("load reports an unreadable file as a read failure", "[loader]") {
  test::TempDir dir;
  std::ostringstream diag;

  auto r = load<TestConfiguration>(dir.path() / "absent.ncl", diag);
  REQUIRE_FALSE(r.ok());
  CHECK(r.error().kind() == Error::Kind::kReadFailure);
  REQUIRE(r.error().read() != nullptr);
  CHECK(r.error().read()->message.find("absent.ncl") != std::string::npos);
}

TEST_CASE("load reports malformed content as an evaluation failure", "[loader]") {
  test::TempDir dir;
  const auto file = dir.write("config.ncl", "{ test_value = \"nick\" ");

  std::ostringstream diag;
  auto r = load<TestConfiguration>(file, diag);
  REQUIRE_FALSE(r.ok());
  CHECK(r.error().kind() == Error::Kind::kEvaluationFailure);
  REQUIRE(r.error().evaluation() != nullptr);
  CHECK(r.error().evaluation()->error.kind == lang::EvalError::Kind::kParse);
  CHECK(diag.str().find("error[parse]") != std::string::npos);
  CHECK(r.error().message().rfind("evaluation failed: ", 0) == 0);
}

TEST_CASE("load reports a broken contract as an evaluation failure", "[loader]") {
  test::TempDir dir;
  const auto file = dir.write("config.ncl", R"({ test_value | String = 42 })");

  std::ostringstream diag;
  auto r = load<TestConfiguration>(file, diag);
  REQUIRE_FALSE(r.ok());
  CHECK(r.error().kind() == Error::Kind::kEvaluationFailure);
  CHECK(r.error().evaluation()->error.kind == lang::EvalError::Kind::kContract);
}

TEST_CASE("load reports a shape mismatch as a decode failure", "[loader]") {
  test::TempDir dir;
  std::ostringstream diag;

  SECTION("missing field") {
    const auto file = dir.write("config.ncl", R"({ other_value = "nick" })");
    auto r = load<TestConfiguration>(file, diag);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind() == Error::Kind::kDecodeFailure);
    REQUIRE(r.error().decode() != nullptr);
    CHECK(r.error().decode()->error.message.find("missing field `test_value`") !=
          std::string::npos);
  }
  SECTION("wrong field type") {
    const auto file = dir.write("config.ncl", R"({ test_value = ["nick"] })");
    auto r = load<TestConfiguration>(file, diag);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind() == Error::Kind::kDecodeFailure);
    CHECK(r.error().decode()->error.message.find("field `test_value`") != std::string::npos);
  }
  SECTION("top level is not a record") {
    const auto file = dir.write("config.ncl", R"([1, 2])");
    auto r = load<TestConfiguration>(file, diag);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind() == Error::Kind::kDecodeFailure);
    CHECK(r.error().message().rfind("configuration has the wrong shape: ", 0) == 0);
  }
}

TEST_CASE("load rejects scalars of the wrong type", "[loader]") {
  test::TempDir dir;
  std::ostringstream diag;

  SECTION("Number into a string field") {
    const auto file = dir.write("config.ncl", R"({ test_value = 42 })");
    auto r = load<TestConfiguration>(file, diag);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind() == Error::Kind::kDecodeFailure);
    CHECK(r.error().decode()->error.message ==
          "field `test_value`: expected a String, got a Number");
  }
  SECTION("Bool into a string field") {
    const auto file = dir.write("config.ncl", R"({ test_value = true })");
    auto r = load<TestConfiguration>(file, diag);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind() == Error::Kind::kDecodeFailure);
  }
  SECTION("numeric String into an int field") {
    const auto file = dir.write("config.ncl", R"({ port = "80" })");
    auto r = load<Port>(file, diag);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind() == Error::Kind::kDecodeFailure);
    CHECK(r.error().decode()->error.message == "field `port`: expected a Number, got a String");
  }
  SECTION("Bool into an int field") {
    const auto file = dir.write("config.ncl", R"({ port = true })");
    auto r = load<Port>(file, diag);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind() == Error::Kind::kDecodeFailure);
  }
  SECTION("Number inside a list of strings") {
    const auto file = dir.write("config.ncl", R"({ host = "h", tags = ["a", 1] })");
    auto r = load<Server>(file, diag);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind() == Error::Kind::kDecodeFailure);
  }
  SECTION("top-level scalar") {
    const auto file = dir.write("config.ncl", R"("80")");
    auto r = load<int>(file, diag);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind() == Error::Kind::kDecodeFailure);
  }
}

TEST_CASE("load accepts scalars of the right type", "[loader]") {
  test::TempDir dir;
  std::ostringstream diag;

  const auto port = dir.write("port.ncl", R"({ port = 8080 })");
  auto p = load<Port>(port, diag);
  REQUIRE(p.ok());
  CHECK(p->port == 8080);

  const auto ratio = dir.write("ratio.ncl", "0.5");
  auto d = load<double>(ratio, diag);
  REQUIRE(d.ok());
  CHECK(*d == Approx(0.5));

  const auto flag = dir.write("flag.ncl", "1 < 2");
  auto b = load<bool>(flag, diag);
  REQUIRE(b.ok());
  CHECK(*b);
}

TEST_CASE("load reports absurdly nested content as an evaluation failure", "[loader]") {
  test::TempDir dir;
  const auto file = dir.write("config.ncl", std::string(200000, '['));

  std::ostringstream diag;
  auto r = load<YAML::Node>(file, diag);
  REQUIRE_FALSE(r.ok());
  CHECK(r.error().kind() == Error::Kind::kEvaluationFailure);
  CHECK(r.error().evaluation()->error.kind == lang::EvalError::Kind::kParse);
}
