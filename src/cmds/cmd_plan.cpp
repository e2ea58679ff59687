#include "cmd_plan.h"

#include "cmd_common.h"
#include "dep_merge.h"
#include "resolver.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace skillet {

void cmd_plan::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("plan", "Show the resolution plan and merged dependencies") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--import,-i", cfg_ptr->imports, "Function unit names to include")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_plan::cmd_plan(cmd_plan::cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

std::string cmd_plan_render(graph_reader const &graph,
                            std::vector<std::string> const &imports,
                            std::string_view default_python) {
  auto const plan{ resolve(graph, imports) };
  auto const deps{ merge_dependencies(plan.functions, default_python) };

  std::string out{ "Functions:\n" };
  for (auto const &f : plan.functions) {
    out += "  " + f.name + " (" + f.id + ")";
    if (!f.signature.empty()) { out += "  " + f.signature; }
    out += '\n';
  }

  out += "Collections:\n";
  if (plan.collections.empty()) { out += "  (none)\n"; }
  for (auto const &c : plan.collections) {
    out += "  " + c.name + " (" + c.id + "):";
    for (auto const &[key, value] : c.variables) { out += " " + key; }
    out += '\n';
  }

  out += "Requires-Python: " + deps.python_spec();
  if (deps.python_defaulted) { out += " (default)"; }
  out += '\n';

  out += "Dependencies:\n";
  if (deps.packages.empty()) { out += "  (none)\n"; }
  for (auto const &p : deps.packages) {
    out += "  " + p.req.render() + "  [";
    for (std::size_t i{ 0 }; i < p.declared_by.size(); ++i) {
      if (i) { out += ", "; }
      out += p.declared_by[i];
    }
    out += "]\n";
  }
  return out;
}

bool cmd_plan::execute() {
  auto const s{ load_session(globals_) };
  auto const text{
    cmd_plan_render(*s->graph, cfg_.imports, s->cfg.execution.default_python)
  };
  tui::write_stdout(text);
  return true;
}

}  // namespace skillet
