#pragma once

#include "cmd.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace skillet {

class cmd_exec : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_exec> {
    std::vector<std::string> imports;
    std::optional<std::string> code;
    std::optional<std::filesystem::path> code_file;
    std::optional<std::int64_t> timeout;
    bool json{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_exec(cfg cfg, cli_globals const &globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_globals globals_;
};

}  // namespace skillet
