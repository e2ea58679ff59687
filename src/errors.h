#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace skillet {

struct skillet_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A requested or required function name matched no unit, or more than one.
struct unresolved_reference_error : skillet_error {
  unresolved_reference_error(std::string reference, std::string const &detail)
      : skillet_error{ "Unresolved reference '" + reference + "': " + detail },
        name{ std::move(reference) } {}

  std::string name;
};

struct circular_dependency_error : skillet_error {
  explicit circular_dependency_error(std::string cycle_path)
      : skillet_error{ "Circular dependency detected: " + cycle_path },
        cycle{ std::move(cycle_path) } {}

  std::string cycle;
};

// Missing or unparseable dependency header, bad specifier, or no callable definition.
struct malformed_unit_error : skillet_error {
  malformed_unit_error(std::string unit_name, std::string const &detail)
      : skillet_error{ "Malformed unit '" + unit_name + "': " + detail },
        unit{ std::move(unit_name) } {}

  std::string unit;
};

struct dependency_conflict_error : skillet_error {
  dependency_conflict_error(std::string package_name,
                            std::string const &first,
                            std::string const &second)
      : skillet_error{ "Dependency conflict for '" + package_name + "': " + first +
                       " is incompatible with " + second },
        package{ std::move(package_name) } {}

  std::string package;
};

struct name_collision_error : skillet_error {
  name_collision_error(std::string callable_name,
                       std::string const &first_unit,
                       std::string const &second_unit)
      : skillet_error{ "Name collision: '" + callable_name + "' is defined by both '" +
                       first_unit + "' and '" + second_unit + "'" },
        name{ std::move(callable_name) } {}

  std::string name;
};

// Provisioning or installing the merged dependency set failed. Output is sanitized.
struct dependency_install_error : skillet_error {
  dependency_install_error(std::string const &what, std::string out, std::string err)
      : skillet_error{ what }, stdout_text{ std::move(out) }, stderr_text{ std::move(err) } {}

  std::string stdout_text;
  std::string stderr_text;
};

struct execution_timeout_error : skillet_error {
  using skillet_error::skillet_error;
};

struct execution_failed_error : skillet_error {
  execution_failed_error(std::string const &what, std::optional<int> code)
      : skillet_error{ what }, exit_code{ code } {}

  std::optional<int> exit_code;
};

struct config_error : skillet_error {
  explicit config_error(std::string const &detail)
      : skillet_error{ "Configuration error: " + detail } {}
};

struct graph_load_error : skillet_error {
  explicit graph_load_error(std::string const &detail)
      : skillet_error{ "Graph load error: " + detail } {}
};

}  // namespace skillet
