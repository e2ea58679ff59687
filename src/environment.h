#pragma once

#include "resolver.h"
#include "secret.h"
#include "secret_store.h"

#include <map>
#include <string>
#include <vector>

namespace skillet {

struct materialized_environment {
  std::map<std::string, std::string> variables;  // complete child environment
  std::vector<std::string> sensitive_values;     // for the output sanitizer only
};

// Graph values overlaid with the collection's store file; stored-only keys are appended.
variable_list environment_effective_variables(variable_collection const &collection,
                                              secret_store const *store);

// Allow-listed host variables, then every plan collection in order (later collections
// win). A collection's secret store file overrides its graph values; sensitive graph
// values missing from the file are persisted there. `store` may be null.
materialized_environment materialize_environment(resolution_plan const &plan,
                                                 secret_classifier const &classifier,
                                                 secret_store const *store,
                                                 std::vector<std::string> const &inherit_env);

}  // namespace skillet
