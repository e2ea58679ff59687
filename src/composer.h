#pragma once

#include "dep_merge.h"
#include "resolver.h"

#include <string>
#include <string_view>
#include <vector>

namespace skillet {

struct composed_artifact {
  std::string text;
  std::vector<std::string> callables;  // top-level names, plan order
};

// Merged header, then each unit body (header and __main__ blocks removed) in plan
// order, then `invocation_code`. Throws malformed_unit_error for a unit without a
// top-level definition and name_collision_error when two units define the same name.
composed_artifact compose(resolution_plan const &plan,
                          merged_dependencies const &deps,
                          std::string_view invocation_code);

}  // namespace skillet
