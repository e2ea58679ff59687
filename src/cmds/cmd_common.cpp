#include "cmd_common.h"

#include "errors.h"
#include "graph_lua.h"
#include "tui.h"
#include "util.h"

#include <stdexcept>
#include <utility>

namespace skillet {

session::session(config c, std::unique_ptr<memory_graph> g)
    : cfg{ std::move(c) },
      graph{ std::move(g) },
      classifier{ cfg.secrets.patterns },
      store{ cfg.secrets.store } {}

config load_config_or_defaults(cli_globals const &globals) {
  config cfg{ [&] {
    if (auto const path{ config::find(globals.config_path) }) { return config::load(*path); }
    tui::info("No config file found; using built-in defaults");
    return config::defaults();
  }() };

  if (!globals.log_level_from_cli) { tui::set_threshold(cfg.log_level); }
  return cfg;
}

std::unique_ptr<session> load_session(cli_globals const &globals) {
  auto cfg{ load_config_or_defaults(globals) };

  auto const graph_path{ globals.graph_path ? globals.graph_path : cfg.graph_path };
  if (!graph_path) {
    throw config_error{ "no graph file; pass --graph or set GRAPH in the config file" };
  }

  auto graph{ graph_lua_load(*graph_path) };
  return std::make_unique<session>(std::move(cfg), std::move(graph));
}

std::string read_invocation_code(std::optional<std::string> const &code,
                                 std::optional<std::filesystem::path> const &code_file) {
  if (code && code_file) {
    throw std::runtime_error("--code and --code-file are mutually exclusive");
  }
  if (code) { return *code; }
  if (code_file) { return util_load_text(*code_file); }
  throw std::runtime_error("one of --code or --code-file is required");
}

}  // namespace skillet
