#pragma once

#include "graph.h"

#include <string>
#include <vector>

namespace skillet {

struct resolution_plan {
  std::vector<function_unit> functions;          // inclusion order, distinct
  std::vector<variable_collection> collections;  // owning unit order, then edge order
  std::vector<std::string> visited;              // ids of every unit walked

  std::vector<std::string> function_names() const;
};

// Walk contains-edges and docstring `Requires:` directives from `names`. Throws
// unresolved_reference_error for missing or ambiguous names and
// circular_dependency_error when the discovered edges form a cycle.
resolution_plan resolve(graph_reader const &graph, std::vector<std::string> const &names);

}  // namespace skillet
