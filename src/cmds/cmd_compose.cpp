#include "cmd_compose.h"

#include "cmd_common.h"
#include "composer.h"
#include "dep_merge.h"
#include "resolver.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace skillet {

void cmd_compose::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("compose", "Print the composed artifact without running it") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--import,-i", cfg_ptr->imports, "Function unit names to include");
  auto *code{ sub->add_option("--code,-c", cfg_ptr->code, "Invocation code") };
  auto *code_file{ sub->add_option("--code-file", cfg_ptr->code_file, "File with invocation code")
                       ->check(CLI::ExistingFile) };
  code->excludes(code_file);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_compose::cmd_compose(cmd_compose::cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

bool cmd_compose::execute() {
  auto const code{ read_invocation_code(cfg_.code, cfg_.code_file) };
  auto const s{ load_session(globals_) };

  auto const plan{ resolve(*s->graph, cfg_.imports) };
  auto const deps{ merge_dependencies(plan.functions, s->cfg.execution.default_python) };
  auto const artifact{ compose(plan, deps, code) };

  tui::write_stdout(artifact.text);
  return true;
}

}  // namespace skillet
