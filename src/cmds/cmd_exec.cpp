#include "cmd_exec.h"

#include "cmd_common.h"
#include "errors.h"
#include "invocation.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace skillet {

void cmd_exec::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("exec", "Compose functions and run invocation code") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--import,-i", cfg_ptr->imports, "Function unit names to include");
  auto *code{ sub->add_option("--code,-c", cfg_ptr->code, "Invocation code") };
  auto *code_file{ sub->add_option("--code-file", cfg_ptr->code_file, "File with invocation code")
                       ->check(CLI::ExistingFile) };
  code->excludes(code_file);
  sub->add_option("--timeout,-t", cfg_ptr->timeout, "Timeout in seconds")
      ->check(CLI::PositiveNumber);
  sub->add_flag("--json", cfg_ptr->json, "Print the response as one JSON object");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_exec::cmd_exec(cmd_exec::cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

bool cmd_exec::execute() {
  auto const code{ read_invocation_code(cfg_.code, cfg_.code_file) };
  auto const s{ load_session(globals_) };

  invocation_response response;
  try {
    response = invoke(invocation_ctx{ .graph = *s->graph,
                                      .execution = s->cfg.execution,
                                      .classifier = s->classifier,
                                      .store = &s->store },
                      invocation_request{ .code = code,
                                          .imports = cfg_.imports,
                                          .timeout = cfg_.timeout });
  } catch (dependency_install_error const &e) {
    tui::write_stdout(e.stdout_text);
    tui::write_stderr(e.stderr_text);
    throw;
  }

  if (cfg_.json) {
    tui::print_stdout("%s\n", response.to_json().c_str());
  } else {
    tui::write_stdout(response.stdout_text);
    tui::write_stderr(response.stderr_text);
  }

  switch (response.status) {
    case run_status::succeeded:
      tui::debug("Succeeded in %lld ms", static_cast<long long>(response.duration_ms));
      return true;
    case run_status::timed_out:
      tui::error("Execution timed out after %llds", static_cast<long long>(response.timeout));
      return false;
    default:
      tui::error("Execution failed with exit code %d", response.exit_code.value_or(-1));
      return false;
  }
}

}  // namespace skillet
