#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  skillet::tui::init();

  auto args{ skillet::cli_parse(argc, argv) };
  skillet::tui::configure_trace_outputs(args.trace_outputs);
  skillet::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      skillet::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    skillet::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit(
      [&](auto const &cfg) { return skillet::cmd::create(cfg, args.globals); },
      *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    skillet::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
