#pragma once

#include "graph.h"
#include "requirement.h"

#include <string>
#include <string_view>
#include <vector>

namespace skillet {

struct merged_package {
  requirement req;
  std::vector<std::string> declared_by;  // unit names, declaration order
};

struct merged_dependencies {
  std::vector<merged_package> packages;  // first-declaration order
  version_range python;
  bool python_defaulted;

  std::vector<std::string> package_specs() const;  // rendered requirements
  std::string python_spec() const;
};

// Union the inline headers of `units`. Throws malformed_unit_error for a missing or bad
// header or specifier and dependency_conflict_error when two declarations cannot both
// hold. `default_python` applies only when no unit declares requires-python.
merged_dependencies merge_dependencies(std::vector<function_unit> const &units,
                                       std::string_view default_python);

}  // namespace skillet
