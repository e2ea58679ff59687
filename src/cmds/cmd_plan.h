#pragma once

#include "cmd.h"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace CLI { class App; }

namespace skillet {

class graph_reader;

class cmd_plan : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_plan> {
    std::vector<std::string> imports;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_plan(cfg cfg, cli_globals const &globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_globals globals_;
};

// Human-readable resolution plan and merged dependency set.
std::string cmd_plan_render(graph_reader const &graph,
                            std::vector<std::string> const &imports,
                            std::string_view default_python);

}  // namespace skillet
