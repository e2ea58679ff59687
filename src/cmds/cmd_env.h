#pragma once

#include "cmd.h"

#include <functional>
#include <string>

namespace CLI { class App; }

namespace skillet {

class graph_reader;
class secret_classifier;
class secret_store;
struct variable_collection;

class cmd_env : public cmd {
 public:
  enum class action { show, keys };

  struct cfg : cmd_cfg<cmd_env> {
    action what{ action::show };
    std::string collection;  // name or id
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_env(cfg cfg, cli_globals const &globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_globals globals_;
};

// Name first, then id. Throws std::runtime_error when missing or ambiguous.
variable_collection const &cmd_env_find_collection(graph_reader const &graph,
                                                   std::string const &name_or_id);

// `show`: NAME=value lines with sensitive values masked. `keys`: names only, sensitive
// ones flagged.
std::string cmd_env_render(variable_collection const &collection,
                           secret_classifier const &classifier,
                           secret_store const *store,
                           cmd_env::action what);

}  // namespace skillet
