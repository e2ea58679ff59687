#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillet {

// Inline script metadata block (PEP 723):
//
//   # /// script
//   # requires-python = ">=3.12"
//   # dependencies = [
//   #   "requests<3",
//   # ]
//   # ///
struct script_header {
  std::optional<std::string> requires_python;
  std::vector<std::string> dependencies;  // raw requirement strings, declaration order
};

// Parse the "script" block of `source`. Throws std::invalid_argument when the block is
// missing, unterminated, duplicated or not valid TOML for the supported subset.
script_header script_meta_parse(std::string_view source);

// `source` without its "script" block lines; other text is untouched.
std::string script_meta_strip_header(std::string_view source);

std::string script_meta_render_header(std::optional<std::string> const &requires_python,
                                      std::vector<std::string> const &dependencies);

// Names listed on "Requires: a, b" lines of the module docstring (case-insensitive,
// repeatable), in order of appearance, without duplicates.
std::vector<std::string> script_meta_requires(std::string_view source);

// Remove top-level `if __name__ == "__main__":` blocks.
std::string script_meta_strip_main_guard(std::string_view source);

// Names bound by column-0 `def`, `async def` and `class` statements, outside strings.
std::vector<std::string> script_meta_callables(std::string_view source);

}  // namespace skillet
