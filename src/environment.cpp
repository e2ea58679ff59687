#include "environment.h"

#include "platform.h"
#include "tui.h"

#include <algorithm>

namespace skillet {

variable_list environment_effective_variables(variable_collection const &collection,
                                              secret_store const *store) {
  variable_list values{ collection.variables };
  if (!store) { return values; }

  if (auto const stored{ store->read(collection.id) }) {
    for (auto const &[key, value] : *stored) {
      auto const it{ std::find_if(values.begin(), values.end(), [&](auto const &kv) {
        return kv.first == key;
      }) };
      if (it != values.end()) {
        it->second = value;
      } else {
        values.emplace_back(key, value);
      }
    }
  }
  return values;
}

materialized_environment materialize_environment(resolution_plan const &plan,
                                                 secret_classifier const &classifier,
                                                 secret_store const *store,
                                                 std::vector<std::string> const &inherit_env) {
  materialized_environment env;

  for (auto const &name : inherit_env) {
    if (auto value{ platform::get_env_var(name.c_str()) }) {
      if (classifier.is_sensitive(name) && !value->empty()) {
        env.sensitive_values.push_back(*value);
      }
      env.variables[name] = std::move(*value);
    }
  }

  std::map<std::string, std::string> origin;  // variable -> collection that set it

  for (auto const &collection : plan.collections) {
    auto const values{ environment_effective_variables(collection, store) };

    if (store) {
      variable_list sensitive;
      for (auto const &[key, value] : collection.variables) {
        if (classifier.is_sensitive(key)) { sensitive.emplace_back(key, value); }
      }
      if (auto const added{ store->persist_missing(collection.id, sensitive) }) {
        tui::debug("Stored %zu sensitive variable(s) for collection %s",
                   added,
                   collection.name.c_str());
      }
    }

    for (auto &value : secret_sensitive_values(values, classifier)) {
      env.sensitive_values.push_back(std::move(value));
    }

    for (auto const &[key, value] : values) {
      if (auto const prev{ origin.find(key) };
          prev != origin.end() && prev->second != collection.name) {
        tui::debug("Variable %s from collection %s overrides collection %s",
                   key.c_str(),
                   collection.name.c_str(),
                   prev->second.c_str());
      }
      origin[key] = collection.name;
      env.variables[key] = value;
    }
  }

  return env;
}

}  // namespace skillet
