#include "script_meta.h"

#include "doctest.h"

#include <stdexcept>
#include <string>

namespace {

constexpr char const *kFetchUnit{ R"py(# /// script
# requires-python = ">=3.10"
# dependencies = [
#   "requests>=2.28,<3",  # http
#   'rich',
# ]
#
# [tool.uv]
# exclude-newer = "2024-01-01T00:00:00Z"
# ///
"""Fetch a URL.

Requires: parse, normalize
requires: parse
"""

import requests


def fetch(url):
    return requests.get(url).text


if __name__ == "__main__":
    print(fetch("https://example.com"))

    print("done")
)py" };

}  // namespace

TEST_CASE("script_meta_parse reads requires-python and dependencies") {
  auto const header{ skillet::script_meta_parse(kFetchUnit) };
  REQUIRE(header.requires_python.has_value());
  CHECK(*header.requires_python == ">=3.10");
  CHECK(header.dependencies == std::vector<std::string>{ "requests>=2.28,<3", "rich" });
}

TEST_CASE("script_meta_parse accepts an empty block and single-line arrays") {
  auto const empty{ skillet::script_meta_parse("# /// script\n# ///\ndef f(): pass\n") };
  CHECK_FALSE(empty.requires_python.has_value());
  CHECK(empty.dependencies.empty());

  auto const inline_list{ skillet::script_meta_parse(
      "# /// script\n# dependencies = [\"a\", \"b\",]\n# ///\n") };
  CHECK(inline_list.dependencies == std::vector<std::string>{ "a", "b" });
}

TEST_CASE("script_meta_parse handles CRLF line endings") {
  auto const header{ skillet::script_meta_parse(
      "# /// script\r\n# requires-python = \">=3.11\"\r\n# ///\r\n") };
  REQUIRE(header.requires_python.has_value());
  CHECK(*header.requires_python == ">=3.11");
}

TEST_CASE("script_meta_parse rejects missing or malformed blocks") {
  CHECK_THROWS_AS(skillet::script_meta_parse("def f():\n  pass\n"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::script_meta_parse("# /// script\n# dependencies = []\n"),
                  std::invalid_argument);
  CHECK_THROWS_AS(skillet::script_meta_parse("# /// script\nimport os\n# ///\n"),
                  std::invalid_argument);
  CHECK_THROWS_AS(skillet::script_meta_parse("# /// script\n# dependencies = [\n# ///\n"),
                  std::invalid_argument);
  CHECK_THROWS_AS(skillet::script_meta_parse("# /// script\n# dependencies = \"x\"\n# ///\n"),
                  std::invalid_argument);
  CHECK_THROWS_AS(skillet::script_meta_parse("# /// script\n# requires-python = 3\n# ///\n"),
                  std::invalid_argument);
  CHECK_THROWS_AS(skillet::script_meta_parse("# /// script\n# [project]\n# ///\n"),
                  std::invalid_argument);
  CHECK_THROWS_AS(
      skillet::script_meta_parse("# /// script\n# ///\n# /// script\n# ///\n"),
      std::invalid_argument);
}

TEST_CASE("script_meta_strip_header removes only the block") {
  auto const stripped{ skillet::script_meta_strip_header(
      "# /// script\n# dependencies = []\n# ///\nimport os\n") };
  CHECK(stripped == "import os\n");
}

TEST_CASE("script_meta_render_header round-trips through the parser") {
  auto const text{ skillet::script_meta_render_header(">=3.12", { "requests>=2.31", "rich" }) };
  CHECK(text ==
        "# /// script\n"
        "# requires-python = \">=3.12\"\n"
        "# dependencies = [\n"
        "#   \"requests>=2.31\",\n"
        "#   \"rich\",\n"
        "# ]\n"
        "# ///\n");

  auto const parsed{ skillet::script_meta_parse(text) };
  CHECK(parsed.dependencies.size() == 2);

  CHECK(skillet::script_meta_render_header(std::nullopt, {}) ==
        "# /// script\n# dependencies = []\n# ///\n");
}

TEST_CASE("script_meta_requires reads docstring directives") {
  CHECK(skillet::script_meta_requires(kFetchUnit) ==
        std::vector<std::string>{ "parse", "normalize" });
  CHECK(skillet::script_meta_requires("'''Requires: a'''\n") ==
        std::vector<std::string>{ "a" });
  CHECK(skillet::script_meta_requires("import os\n\"\"\"Requires: a\"\"\"\n").empty());
  CHECK(skillet::script_meta_requires("# Requires: a\ndef f(): pass\n").empty());
}

TEST_CASE("script_meta_strip_main_guard drops guarded block") {
  auto const body{ skillet::script_meta_strip_main_guard(
      skillet::script_meta_strip_header(kFetchUnit)) };
  CHECK(body.find("__main__") == std::string::npos);
  CHECK(body.find("print(\"done\")") == std::string::npos);
  CHECK(body.find("def fetch(url):") != std::string::npos);

  auto const reversed{ skillet::script_meta_strip_main_guard(
      "def f():\n    pass\nif '__main__' == __name__:  # run\n    f()\nx = 1\n") };
  CHECK(reversed == "def f():\n    pass\nx = 1\n");
}

TEST_CASE("script_meta_strip_main_guard ignores guards inside strings and nested guards") {
  std::string const src{ "DOC = \"\"\"\nif __name__ == \"__main__\":\n\"\"\"\n"
                         "def f():\n    if __name__ == \"__main__\":\n        pass\n" };
  CHECK(skillet::script_meta_strip_main_guard(src) == src);
}

TEST_CASE("script_meta_callables finds top-level definitions") {
  auto const names{ skillet::script_meta_callables(
      "import os\n"
      "def fetch(url):\n"
      "    def inner():\n"
      "        pass\n"
      "async  def stream(url):\n"
      "    pass\n"
      "class Parser:\n"
      "    pass\n"
      "class Empty(object): pass\n"
      "\"\"\"\n"
      "def not_code():\n"
      "\"\"\"\n"
      "default = 3\n") };
  CHECK(names == std::vector<std::string>{ "fetch", "stream", "Parser", "Empty" });
}

TEST_CASE("script_meta_callables returns nothing for plain statements") {
  CHECK(skillet::script_meta_callables("x = 1\nprint(x)\n").empty());
}
