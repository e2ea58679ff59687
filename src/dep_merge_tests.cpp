#include "dep_merge.h"

#include "errors.h"

#include "doctest.h"

#include <string>
#include <vector>

namespace {

skillet::function_unit unit(std::string name, std::string header_body) {
  auto id{ name };
  return skillet::function_unit{ .id = std::move(id),
                                 .name = std::move(name),
                                 .description = {},
                                 .signature = {},
                                 .body = "# /// script\n" + header_body + "# ///\ndef f(): pass\n" };
}

}  // namespace

TEST_CASE("merge_dependencies unions disjoint package sets") {
  auto const merged{ skillet::merge_dependencies(
      { unit("fetch", "# dependencies = [\"requests>=2.31\"]\n"),
        unit("parse", "# dependencies = [\"beautifulsoup4\", \"lxml>=5\"]\n") },
      ">=3.12") };

  CHECK(merged.package_specs() ==
        std::vector<std::string>{ "requests>=2.31", "beautifulsoup4", "lxml>=5" });
  CHECK(merged.python_defaulted);
  CHECK(merged.python_spec() == ">=3.12");
}

TEST_CASE("merge_dependencies intersects overlapping ranges") {
  auto const merged{ skillet::merge_dependencies(
      { unit("a", "# dependencies = [\"Requests>=2.28,<3\"]\n"),
        unit("b", "# dependencies = [\"requests[socks]>=2.31\"]\n") },
      ">=3.12") };

  REQUIRE(merged.packages.size() == 1);
  CHECK(merged.packages[0].req.render() == "requests[socks]>=2.31,<3");
  CHECK(merged.packages[0].declared_by == std::vector<std::string>{ "a", "b" });
}

TEST_CASE("merge_dependencies rejects disjoint ranges naming both declarations") {
  try {
    static_cast<void>(skillet::merge_dependencies(
        { unit("old", "# dependencies = [\"pydantic<2\"]\n"),
          unit("new", "# dependencies = [\"pydantic>=2.5\"]\n") },
        ">=3.12"));
    FAIL("expected dependency_conflict_error");
  } catch (skillet::dependency_conflict_error const &e) {
    CHECK(e.package == "pydantic");
    std::string const what{ e.what() };
    CHECK(what.find("pydantic<2") != std::string::npos);
    CHECK(what.find("pydantic>=2.5") != std::string::npos);
    CHECK(what.find("old") != std::string::npos);
    CHECK(what.find("new") != std::string::npos);
  }
}

TEST_CASE("merge_dependencies rejects differing markers") {
  CHECK_THROWS_AS(static_cast<void>(skillet::merge_dependencies(
                      { unit("a", "# dependencies = [\"uvloop; sys_platform != 'win32'\"]\n"),
                        unit("b", "# dependencies = [\"uvloop\"]\n") },
                      ">=3.12")),
                  skillet::dependency_conflict_error);
}

TEST_CASE("merge_dependencies takes the highest declared python minimum") {
  auto const merged{ skillet::merge_dependencies(
      { unit("a", "# requires-python = \">=3.10\"\n"),
        unit("b", "# requires-python = \">=3.12\"\n"),
        unit("c", "") },
      ">=3.9") };
  CHECK_FALSE(merged.python_defaulted);
  CHECK(merged.python_spec() == ">=3.12");
}

TEST_CASE("merge_dependencies rejects incompatible python requirements") {
  try {
    static_cast<void>(skillet::merge_dependencies(
        { unit("a", "# requires-python = \"<3.9\"\n"),
          unit("b", "# requires-python = \">=3.12\"\n") },
        ">=3.12"));
    FAIL("expected dependency_conflict_error");
  } catch (skillet::dependency_conflict_error const &e) {
    CHECK(e.package == "python");
  }
}

TEST_CASE("merge_dependencies reports malformed units by name") {
  skillet::function_unit no_header{ .id = "x",
                                    .name = "bare",
                                    .description = {},
                                    .signature = {},
                                    .body = "def f(): pass\n" };
  try {
    static_cast<void>(skillet::merge_dependencies({ no_header }, ">=3.12"));
    FAIL("expected malformed_unit_error");
  } catch (skillet::malformed_unit_error const &e) {
    CHECK(e.unit == "bare");
  }

  CHECK_THROWS_AS(static_cast<void>(skillet::merge_dependencies(
                      { unit("bad", "# dependencies = [\"requests>=two\"]\n") }, ">=3.12")),
                  skillet::malformed_unit_error);
  CHECK_THROWS_AS(static_cast<void>(skillet::merge_dependencies(
                      { unit("bad", "# requires-python = \"3.12\"\n") }, ">=3.12")),
                  skillet::malformed_unit_error);
}

TEST_CASE("merge_dependencies with no units uses defaults") {
  auto const merged{ skillet::merge_dependencies({}, ">=3.12") };
  CHECK(merged.packages.empty());
  CHECK(merged.python_spec() == ">=3.12");
}
