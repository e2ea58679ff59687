#include "config.h"

#include "errors.h"
#include "platform.h"
#include "requirement.h"
#include "secret.h"
#include "sol_util.h"
#include "util.h"

#include <stdexcept>

namespace skillet {

namespace {

std::filesystem::path default_data_root() {
  if (auto root{ platform::get_default_data_root() }) { return *root; }
  return std::filesystem::temp_directory_path() / "skillet";
}

std::optional<sol::table> get_section(sol::state &lua, char const *name) {
  sol::object const obj{ lua[name] };
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) { return std::nullopt; }
  if (obj.get_type() != sol::type::table) {
    throw config_error{ std::string{ name } + " must be a table" };
  }
  return obj.as<sol::table>();
}

void read_execution(sol::table const &t, execution_cfg &e) {
  constexpr std::string_view ctx{ "EXECUTION" };

  e.default_timeout = sol_util_get_or_default<std::int64_t>(t, "default_timeout",
                                                            e.default_timeout, ctx);
  e.max_timeout = sol_util_get_or_default<std::int64_t>(t, "max_timeout", e.max_timeout, ctx);
  e.install_timeout = sol_util_get_or_default<std::int64_t>(t, "install_timeout",
                                                            e.install_timeout, ctx);

  if (auto const limit{ sol_util_get_optional<std::int64_t>(t, "output_limit", ctx) }) {
    if (*limit <= 0) { throw config_error{ "EXECUTION: output_limit must be positive" }; }
    e.output_limit = static_cast<std::size_t>(*limit);
  }

  e.default_python = sol_util_get_or_default<std::string>(t, "default_python",
                                                          e.default_python, ctx);

  if (auto const p{ sol_util_get_optional<std::string>(t, "work_root", ctx) }) {
    e.work_root = platform::expand_path(*p);
  }
  if (auto const p{ sol_util_get_optional<std::string>(t, "package_cache", ctx) }) {
    e.package_cache = platform::expand_path(*p);
  }

  if (auto const mb{ sol_util_get_optional<std::int64_t>(t, "memory_limit_mb", ctx) }) {
    e.memory_limit_mb = *mb;
  }
  if (auto const cpu{ sol_util_get_optional<std::int64_t>(t, "cpu_limit_s", ctx) }) {
    e.cpu_limit_s = *cpu;
  }

  if (auto v{ sol_util_get_string_array(t, "inherit_env", ctx) }) {
    e.inherit_env = std::move(*v);
  }
  if (auto v{ sol_util_get_string_array(t, "provision", ctx) }) { e.provision = std::move(*v); }
  if (auto v{ sol_util_get_string_array(t, "install", ctx) }) { e.install = std::move(*v); }
  if (auto v{ sol_util_get_string_array(t, "interpreter", ctx) }) {
    e.interpreter = std::move(*v);
  }
}

void read_secrets(sol::table const &t, secrets_cfg &s) {
  constexpr std::string_view ctx{ "SECRETS" };

  if (auto v{ sol_util_get_string_array(t, "patterns", ctx) }) { s.patterns = std::move(*v); }
  if (auto const p{ sol_util_get_optional<std::string>(t, "store", ctx) }) {
    s.store = platform::expand_path(*p);
  }
}

}  // namespace

config config::defaults() {
  auto const data_root{ default_data_root() };

  config cfg;
  cfg.execution.work_root = data_root / "work";
  cfg.execution.inherit_env = { "PATH", "HOME", "LANG", "LC_ALL", "TMPDIR" };
  cfg.execution.provision = { "uv", "venv", "--quiet", "--python", "{python}", "{venv}" };
  cfg.execution.install = { "uv",       "pip",           "install",   "--quiet",
                            "--python", "{venv}/bin/python", "{packages}" };
  cfg.execution.interpreter = { "{venv}/bin/python", "{script}" };
  cfg.secrets.patterns = secret_default_patterns();
  cfg.secrets.store = data_root / "secrets";
  return cfg;
}

config config::parse(std::string_view script, std::filesystem::path const &source) {
  config cfg{ defaults() };
  cfg.source = source;

  try {
    auto lua{ sol_util_make_lua_state() };
    sol_util_run_script(*lua, script, "Failed to execute config " + source.string());

    if (auto const t{ get_section(*lua, "EXECUTION") }) { read_execution(*t, cfg.execution); }
    if (auto const t{ get_section(*lua, "SECRETS") }) { read_secrets(*t, cfg.secrets); }

    sol::object const graph{ (*lua)["GRAPH"] };
    if (graph.valid() && graph.get_type() != sol::type::lua_nil) {
      if (!graph.is<std::string>()) { throw config_error{ "GRAPH must be a string" }; }
      auto path{ platform::expand_path(graph.as<std::string>()) };
      if (path.is_relative()) { path = source.parent_path() / path; }
      cfg.graph_path = path.lexically_normal();
    }

    if (auto const t{ get_section(*lua, "LOGGING") }) {
      if (auto const name{ sol_util_get_optional<std::string>(*t, "level", "LOGGING") }) {
        auto const level{ tui::parse_level(*name) };
        if (!level) { throw config_error{ "LOGGING: unknown level '" + *name + "'" }; }
        cfg.log_level = *level;
      }
    }
  } catch (config_error const &) {
    throw;
  } catch (std::runtime_error const &e) {
    throw config_error{ e.what() };
  }

  cfg.validate();
  return cfg;
}

config config::load(std::filesystem::path const &path) {
  tui::debug("Loading config from %s", path.string().c_str());
  std::string script;
  try {
    script = util_load_text(path);
  } catch (std::runtime_error const &e) {
    throw config_error{ e.what() };
  }
  return parse(script, path);
}

std::optional<std::filesystem::path> config::find(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw config_error{ "config file not found: " + path.string() };
    }
    return path;
  }

  if (auto const env{ platform::get_env_var("SKILLET_CONFIG") }; env && !env->empty()) {
    std::filesystem::path const path{ *env };
    if (!std::filesystem::exists(path)) {
      throw config_error{ "SKILLET_CONFIG points to a missing file: " + path.string() };
    }
    return path;
  }

  if (auto const path{ platform::get_default_config_path() };
      path && std::filesystem::exists(*path)) {
    return path;
  }
  return std::nullopt;
}

void config::validate() const {
  auto const &e{ execution };
  if (e.default_timeout < 1) {
    throw config_error{ "EXECUTION: default_timeout must be at least 1 second" };
  }
  if (e.max_timeout < e.default_timeout) {
    throw config_error{ "EXECUTION: max_timeout (" + std::to_string(e.max_timeout) +
                        ") is less than default_timeout (" +
                        std::to_string(e.default_timeout) + ")" };
  }
  if (e.install_timeout < 1) {
    throw config_error{ "EXECUTION: install_timeout must be at least 1 second" };
  }
  if (e.interpreter.empty()) { throw config_error{ "EXECUTION: interpreter must not be empty" }; }
  if (e.memory_limit_mb && *e.memory_limit_mb <= 0) {
    throw config_error{ "EXECUTION: memory_limit_mb must be positive" };
  }
  if (e.cpu_limit_s && *e.cpu_limit_s <= 0) {
    throw config_error{ "EXECUTION: cpu_limit_s must be positive" };
  }
  if (e.work_root.empty()) { throw config_error{ "EXECUTION: work_root must not be empty" }; }

  try {
    static_cast<void>(version_range_parse(e.default_python));
  } catch (std::invalid_argument const &ex) {
    throw config_error{ "EXECUTION: default_python: " + std::string{ ex.what() } };
  }

  for (auto const &pattern : secrets.patterns) {
    if (pattern.empty() || pattern == "!") {
      throw config_error{ "SECRETS: patterns must not contain empty entries" };
    }
  }
  if (secrets.store.empty()) { throw config_error{ "SECRETS: store must not be empty" }; }
}

}  // namespace skillet
