#include "composer.h"

#include "errors.h"
#include "script_meta.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <unordered_map>

namespace skillet {

namespace {

// Drop leading and trailing blank lines.
std::string_view trim_blank_lines(std::string_view text) {
  while (!text.empty()) {
    auto const nl{ text.find('\n') };
    auto const first{ text.substr(0, nl) };
    if (!util_trim(first).empty()) { break; }
    text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
  }
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                           text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

composed_artifact compose(resolution_plan const &plan,
                          merged_dependencies const &deps,
                          std::string_view invocation_code) {
  composed_artifact artifact;
  artifact.text =
      script_meta_render_header(deps.python_spec().empty()
                                    ? std::nullopt
                                    : std::optional<std::string>{ deps.python_spec() },
                                deps.package_specs());

  struct owner {
    std::string id;
    std::string name;
  };
  std::unordered_map<std::string, owner> owners;  // callable -> defining unit

  for (auto const &unit : plan.functions) {
    auto const body{ script_meta_strip_main_guard(script_meta_strip_header(unit.body)) };

    auto const callables{ script_meta_callables(body) };
    if (callables.empty()) {
      throw malformed_unit_error{ unit.name, "no top-level def or class definition" };
    }

    for (auto const &name : callables) {
      auto const [it, inserted]{ owners.emplace(name, owner{ unit.id, unit.name }) };
      if (!inserted && it->second.id != unit.id) {
        if (it->second.name == unit.name) {  // same-named units, tell them apart by id
          throw name_collision_error{ name,
                                      it->second.name + " (" + it->second.id + ")",
                                      unit.name + " (" + unit.id + ")" };
        }
        throw name_collision_error{ name, it->second.name, unit.name };
      }
      if (inserted) { artifact.callables.push_back(name); }
    }

    artifact.text += "\n\n# Function: " + unit.name + "\n";
    artifact.text += trim_blank_lines(body);
    artifact.text += "\n";
  }

  artifact.text += "\n\n# Invocation\n";
  artifact.text += trim_blank_lines(invocation_code);
  artifact.text += "\n";

  tui::debug("Composed artifact: %zu unit(s), %zu bytes",
             plan.functions.size(),
             artifact.text.size());
  SKILLET_TRACE_ARTIFACT_COMPOSED(plan.functions.size(), artifact.text.size());

  return artifact;
}

}  // namespace skillet
