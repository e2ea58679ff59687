#pragma once

#include "cmd.h"
#include "config.h"
#include "graph.h"
#include "secret.h"
#include "secret_store.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace skillet {

// Configuration, graph and secret handling shared by the pipeline commands.
struct session : unmovable {
  config cfg;
  std::unique_ptr<memory_graph> graph;
  secret_classifier classifier;
  secret_store store;

  session(config c, std::unique_ptr<memory_graph> g);
};

config load_config_or_defaults(cli_globals const &globals);

// Loads config and graph. Throws config_error when no graph file is configured.
std::unique_ptr<session> load_session(cli_globals const &globals);

// Exactly one of `code` and `code_file` must be set.
std::string read_invocation_code(std::optional<std::string> const &code,
                                 std::optional<std::filesystem::path> const &code_file);

}  // namespace skillet
