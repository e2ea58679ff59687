#include "graph_lua.h"

#include "errors.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace skillet {
namespace {

// Entries of an array-valued global; absent globals yield no entries.
std::vector<sol::table> get_entries(sol::state &lua, char const *name) {
  sol::object const obj{ lua[name] };
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) { return {}; }
  if (obj.get_type() != sol::type::table) {
    throw std::runtime_error(std::string{ name } + " must be a table");
  }

  auto const table{ obj.as<sol::table>() };
  std::vector<sol::table> entries;
  for (std::size_t i{ 1 }, n{ table.size() }; i <= n; ++i) {
    sol::object const entry{ table[i] };
    if (entry.get_type() != sol::type::table) {
      throw std::runtime_error(std::string{ name } + "[" + std::to_string(i) +
                               "] must be a table");
    }
    entries.push_back(entry.as<sol::table>());
  }
  return entries;
}

std::string entry_context(char const *name, std::size_t index) {
  return std::string{ name } + "[" + std::to_string(index + 1) + "]";
}

// id defaults to name.
std::pair<std::string, std::string> read_identity(sol::table const &t, std::string const &ctx) {
  auto name{ sol_util_get_required<std::string>(t, "name", ctx) };
  auto id{ sol_util_get_or_default<std::string>(t, "id", name, ctx) };
  if (id.empty()) { throw std::runtime_error(ctx + ": id must not be empty"); }
  return { std::move(id), std::move(name) };
}

function_unit read_function(sol::table const &t,
                            std::string const &ctx,
                            std::filesystem::path const &base_dir) {
  auto [id, name]{ read_identity(t, ctx) };

  auto body{ sol_util_get_optional<std::string>(t, "body", ctx) };
  auto const body_file{ sol_util_get_optional<std::string>(t, "body_file", ctx) };
  if (body && body_file) {
    throw std::runtime_error(ctx + ": body and body_file are mutually exclusive");
  }
  if (body_file) {
    std::filesystem::path path{ *body_file };
    if (path.is_relative()) { path = base_dir / path; }
    body = util_load_text(path);
  }
  if (!body) { throw std::runtime_error(ctx + ": body or body_file is required"); }

  return function_unit{ .id = std::move(id),
                        .name = std::move(name),
                        .description = sol_util_get_or_default<std::string>(t, "description",
                                                                            "", ctx),
                        .signature = sol_util_get_or_default<std::string>(t, "signature", "", ctx),
                        .body = std::move(*body) };
}

// `variables` is either a string map (sorted by name) or an array of { name, value }
// pairs (declaration order).
variable_list read_variables(sol::table const &t, std::string const &ctx) {
  auto const vars{ sol_util_get_optional<sol::table>(t, "variables", ctx) };
  if (!vars) { return {}; }

  variable_list result;
  if (vars->size() > 0) {
    for (std::size_t i{ 1 }, n{ vars->size() }; i <= n; ++i) {
      sol::object const pair{ (*vars)[i] };
      std::string const pair_ctx{ ctx + ": variables[" + std::to_string(i) + "]" };
      if (pair.get_type() != sol::type::table) {
        throw std::runtime_error(pair_ctx + " must be a { name, value } pair");
      }
      auto const p{ pair.as<sol::table>() };
      sol::object const key{ p[1] };
      sol::object const value{ p[2] };
      if (!key.is<std::string>() || !value.is<std::string>()) {
        throw std::runtime_error(pair_ctx + " must be a { name, value } pair of strings");
      }
      result.emplace_back(key.as<std::string>(), value.as<std::string>());
    }
    return result;
  }

  for (auto const &[key, value] : *vars) {
    if (!key.is<std::string>() || value.get_type() != sol::type::string) {
      throw std::runtime_error(ctx + ": variables must map strings to strings");
    }
    result.emplace_back(key.as<std::string>(), value.as<std::string>());
  }
  std::sort(result.begin(), result.end());
  return result;
}

// { "parent", "child" } style pair at positions 1 and 2.
std::pair<std::string, std::string> read_edge(sol::table const &t, std::string const &ctx) {
  sol::object const a{ t[1] };
  sol::object const b{ t[2] };
  if (!a.is<std::string>() || !b.is<std::string>()) {
    throw std::runtime_error(ctx + " must be a pair of node ids");
  }
  return { a.as<std::string>(), b.as<std::string>() };
}

std::map<std::string, std::string> read_properties(sol::table const &t, std::string const &ctx) {
  std::map<std::string, std::string> props;
  auto const table{ sol_util_get_optional<sol::table>(t, "properties", ctx) };
  if (!table) { return props; }
  for (auto const &[key, value] : *table) {
    if (!key.is<std::string>() || value.get_type() != sol::type::string) {
      throw std::runtime_error(ctx + ": properties must map strings to strings");
    }
    props.emplace(key.as<std::string>(), value.as<std::string>());
  }
  return props;
}

void populate(sol::state &lua, memory_graph &graph, std::filesystem::path const &base_dir) {
  auto const functions{ get_entries(lua, "FUNCTIONS") };
  for (std::size_t i{ 0 }; i < functions.size(); ++i) {
    graph.add_unit(read_function(functions[i], entry_context("FUNCTIONS", i), base_dir));
  }

  auto const collections{ get_entries(lua, "COLLECTIONS") };
  for (std::size_t i{ 0 }; i < collections.size(); ++i) {
    auto const ctx{ entry_context("COLLECTIONS", i) };
    auto [id, name]{ read_identity(collections[i], ctx) };
    graph.add_collection(variable_collection{
        .id = std::move(id),
        .name = std::move(name),
        .description = sol_util_get_or_default<std::string>(collections[i], "description", "", ctx),
        .variables = read_variables(collections[i], ctx) });
  }

  for (auto const &[global, kind] : { std::pair{ "SKILLS", node_kind::skill },
                                      std::pair{ "KNOWLEDGE", node_kind::knowledge } }) {
    auto const nodes{ get_entries(lua, global) };
    for (std::size_t i{ 0 }; i < nodes.size(); ++i) {
      auto [id, name]{ read_identity(nodes[i], entry_context(global, i)) };
      graph.add_node(std::move(id), kind, std::move(name));
    }
  }

  auto const contains{ get_entries(lua, "CONTAINS") };
  for (std::size_t i{ 0 }; i < contains.size(); ++i) {
    auto const [parent, child]{ read_edge(contains[i], entry_context("CONTAINS", i)) };
    graph.add_contains(parent, child);
  }

  auto const relates{ get_entries(lua, "RELATES") };
  for (std::size_t i{ 0 }; i < relates.size(); ++i) {
    auto const ctx{ entry_context("RELATES", i) };
    auto const [a, b]{ read_edge(relates[i], ctx) };
    graph.add_relates(a, b, read_properties(relates[i], ctx));
  }
}

}  // namespace

std::unique_ptr<memory_graph> graph_lua_parse(std::string_view script,
                                              std::filesystem::path const &base_dir,
                                              std::string_view source_name) {
  auto graph{ std::make_unique<memory_graph>() };
  try {
    auto lua{ sol_util_make_lua_state() };
    sol_util_run_script(*lua, script, "Failed to execute graph file");
    populate(*lua, *graph, base_dir);
  } catch (std::exception const &e) {
    throw graph_load_error{ std::string{ source_name } + ": " + e.what() };
  }

  tui::debug("Loaded graph %.*s: %zu nodes, %zu edges",
             static_cast<int>(source_name.size()),
             source_name.data(),
             graph->node_count(),
             graph->edge_count());
  return graph;
}

std::unique_ptr<memory_graph> graph_lua_load(std::filesystem::path const &path) {
  std::string script;
  try {
    script = util_load_text(path);
  } catch (std::runtime_error const &e) {
    throw graph_load_error{ e.what() };
  }
  return graph_lua_parse(script, path.parent_path(), path.string());
}

}  // namespace skillet
