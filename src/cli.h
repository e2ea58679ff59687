#pragma once

#include "cmd.h"
#include "cmds/cmd_batch.h"
#include "cmds/cmd_compose.h"
#include "cmds/cmd_env.h"
#include "cmds/cmd_exec.h"
#include "cmds/cmd_plan.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace skillet {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_batch::cfg,
                                 cmd_compose::cfg,
                                 cmd_env::cfg,
                                 cmd_exec::cfg,
                                 cmd_plan::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  cli_globals globals;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace skillet
