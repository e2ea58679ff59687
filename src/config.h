#pragma once

#include "tui.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillet {

struct execution_cfg {
  std::int64_t default_timeout{ 300 };  // seconds
  std::int64_t max_timeout{ 600 };
  std::int64_t install_timeout{ 600 };  // provision + install
  std::size_t output_limit{ 1048576 };  // bytes per stream
  std::string default_python{ ">=3.12" };
  std::filesystem::path work_root;
  std::optional<std::filesystem::path> package_cache;
  std::optional<std::int64_t> memory_limit_mb;
  std::optional<std::int64_t> cpu_limit_s;
  std::vector<std::string> inherit_env;

  // argv templates; placeholders {python} {venv} {script} {scratch} {packages}
  std::vector<std::string> provision;
  std::vector<std::string> install;
  std::vector<std::string> interpreter;
};

struct secrets_cfg {
  std::vector<std::string> patterns;
  std::filesystem::path store;
};

struct config {
  execution_cfg execution;
  secrets_cfg secrets;
  std::optional<std::filesystem::path> graph_path;
  tui::level log_level{ tui::level::TUI_INFO };
  std::optional<std::filesystem::path> source;  // file the values came from

  static config defaults();

  // Evaluate `script` over the defaults. Relative GRAPH paths resolve against the
  // directory of `source`. Throws config_error.
  static config parse(std::string_view script, std::filesystem::path const &source);
  static config load(std::filesystem::path const &path);

  // --config (must exist), then $SKILLET_CONFIG / XDG / ~/.config; nullopt when no file.
  static std::optional<std::filesystem::path> find(
      std::optional<std::filesystem::path> const &explicit_path);

  void validate() const;
};

}  // namespace skillet
