#pragma once

#include "cmd.h"
#include "invocation.h"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace CLI { class App; }

namespace skillet {

class cmd_batch : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_batch> {
    std::filesystem::path requests_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_batch(cfg cfg, cli_globals const &globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_globals globals_;
};

// REQUESTS = { { imports = { ... }, code = "...", timeout = n }, ... }
std::vector<invocation_request> cmd_batch_parse(std::string_view script,
                                                std::string_view source_name);

struct batch_result {
  std::string json;  // one response object, or {"error": ...}
  bool succeeded;
};

// Runs every request concurrently; results keep request order.
std::vector<batch_result> cmd_batch_run(invocation_ctx const &ctx,
                                        std::vector<invocation_request> const &requests);

}  // namespace skillet
