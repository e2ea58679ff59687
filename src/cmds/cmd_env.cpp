#include "cmd_env.h"

#include "cmd_common.h"
#include "environment.h"
#include "graph.h"
#include "secret.h"
#include "secret_store.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace skillet {

void cmd_env::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *env{ app.add_subcommand("env", "Inspect variable collections") };
  env->require_subcommand(1);

  auto const add_action{ [&](char const *name, char const *description, action what) {
    auto *sub{ env->add_subcommand(name, description) };
    auto cfg_ptr{ std::make_shared<cfg>() };
    cfg_ptr->what = what;
    sub->add_option("collection", cfg_ptr->collection, "Collection name or id")->required();
    sub->callback([cfg_ptr, on_selected] { on_selected(*cfg_ptr); });
  } };

  add_action("show", "Print variables with sensitive values masked", action::show);
  add_action("keys", "Print variable names only", action::keys);
}

cmd_env::cmd_env(cmd_env::cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

variable_collection const &cmd_env_find_collection(graph_reader const &graph,
                                                   std::string const &name_or_id) {
  auto const by_name{ graph.find_collection(name_or_id) };
  if (by_name.size() > 1) {
    throw std::runtime_error("Collection name '" + name_or_id + "' is ambiguous (" +
                             std::to_string(by_name.size()) + " matches); use its id");
  }
  if (by_name.size() == 1) { return *by_name.front(); }
  if (auto const *by_id{ graph.get_collection(name_or_id) }) { return *by_id; }
  throw std::runtime_error("No collection named '" + name_or_id + "'");
}

std::string cmd_env_render(variable_collection const &collection,
                           secret_classifier const &classifier,
                           secret_store const *store,
                           cmd_env::action what) {
  variable_collection effective{ collection };
  effective.variables = environment_effective_variables(collection, store);

  std::string out;
  for (auto const &v : secret_mask_collection(effective, classifier)) {
    if (what == cmd_env::action::keys) {
      out += v.name + (v.sensitive ? "  (sensitive)\n" : "\n");
    } else {
      out += v.name + "=" + v.value + "\n";
    }
  }
  return out;
}

bool cmd_env::execute() {
  auto const s{ load_session(globals_) };
  auto const &collection{ cmd_env_find_collection(*s->graph, cfg_.collection) };
  tui::write_stdout(cmd_env_render(collection, s->classifier, &s->store, cfg_.what));
  return true;
}

}  // namespace skillet
