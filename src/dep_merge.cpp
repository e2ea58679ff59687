#include "dep_merge.h"

#include "errors.h"
#include "script_meta.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>

namespace skillet {

namespace {

std::string describe(std::string const &spec, std::vector<std::string> const &units) {
  std::string result{ "'" + spec + "' (from " };
  for (std::size_t i{ 0 }; i < units.size(); ++i) {
    if (i) { result += ", "; }
    result += units[i];
  }
  return result + ")";
}

void merge_package(std::vector<merged_package> &packages,
                   requirement req,
                   std::string const &unit_name) {
  auto const it{ std::find_if(packages.begin(), packages.end(), [&](merged_package const &p) {
    return p.req.name == req.name;
  }) };

  if (it == packages.end()) {
    packages.push_back(merged_package{ .req = std::move(req), .declared_by = { unit_name } });
    return;
  }

  if (it->req.marker != req.marker) {
    throw dependency_conflict_error{ req.name,
                                     describe(it->req.render(), it->declared_by),
                                     describe(req.render(), { unit_name }) };
  }

  auto const merged_range{ it->req.range.intersect(req.range) };
  if (merged_range.empty()) {
    throw dependency_conflict_error{ req.name,
                                     describe(it->req.render(), it->declared_by),
                                     describe(req.render(), { unit_name }) };
  }

  it->req.range = merged_range;
  it->req.extras.insert(req.extras.begin(), req.extras.end());
  if (std::find(it->declared_by.begin(), it->declared_by.end(), unit_name) ==
      it->declared_by.end()) {
    it->declared_by.push_back(unit_name);
  }
}

}  // namespace

std::vector<std::string> merged_dependencies::package_specs() const {
  std::vector<std::string> result;
  result.reserve(packages.size());
  for (auto const &p : packages) { result.push_back(p.req.render()); }
  return result;
}

std::string merged_dependencies::python_spec() const { return python.render(); }

merged_dependencies merge_dependencies(std::vector<function_unit> const &units,
                                       std::string_view default_python) {
  merged_dependencies result{ .packages = {}, .python = {}, .python_defaulted = true };
  std::vector<std::string> python_declared_by;

  for (auto const &unit : units) {
    script_header header;
    try {
      header = script_meta_parse(unit.body);
    } catch (std::invalid_argument const &e) {
      throw malformed_unit_error{ unit.name, e.what() };
    }

    if (header.requires_python) {
      version_range declared;
      try {
        declared = version_range_parse(*header.requires_python);
      } catch (std::invalid_argument const &e) {
        throw malformed_unit_error{ unit.name, "requires-python: " + std::string{ e.what() } };
      }

      auto const merged{ result.python.intersect(declared) };
      if (merged.empty()) {
        throw dependency_conflict_error{ "python",
                                         describe(result.python.render(), python_declared_by),
                                         describe(declared.render(), { unit.name }) };
      }
      result.python = merged;
      result.python_defaulted = false;
      python_declared_by.push_back(unit.name);
    }

    for (auto const &dep : header.dependencies) {
      requirement req;
      try {
        req = requirement_parse(dep);
      } catch (std::invalid_argument const &e) {
        throw malformed_unit_error{ unit.name, e.what() };
      }
      merge_package(result.packages, std::move(req), unit.name);
    }
  }

  if (result.python_defaulted) { result.python = version_range_parse(default_python); }

  tui::debug("Merged %zu package(s), python %s",
             result.packages.size(),
             result.python_spec().c_str());
  SKILLET_TRACE_DEPS_MERGED(result.packages.size(), result.python_spec());

  return result;
}

}  // namespace skillet
