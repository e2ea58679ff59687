#include "graph.h"

#include "errors.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace skillet {

std::string_view node_kind_name(node_kind kind) {
  switch (kind) {
    case node_kind::skill: return "skill";
    case node_kind::knowledge: return "knowledge";
    case node_kind::function: return "function";
    case node_kind::collection: return "collection";
  }
  return "unknown";
}

void memory_graph::insert_node(std::string const &id,
                               node_kind kind,
                               std::string const &name) {
  if (id.empty()) { throw std::invalid_argument("memory_graph: node id must not be empty"); }
  if (!nodes_.emplace(id, node{ .kind = kind, .name = name }).second) {
    throw std::invalid_argument("memory_graph: duplicate node id: " + id);
  }
}

void memory_graph::add_unit(function_unit unit) {
  insert_node(unit.id, node_kind::function, unit.name);
  auto id{ unit.id };
  units_.emplace(std::move(id), std::move(unit));
}

void memory_graph::add_collection(variable_collection collection) {
  insert_node(collection.id, node_kind::collection, collection.name);
  auto id{ collection.id };
  collections_.emplace(std::move(id), std::move(collection));
}

void memory_graph::add_node(std::string id, node_kind kind, std::string name) {
  if (kind == node_kind::function || kind == node_kind::collection) {
    throw std::invalid_argument("memory_graph: use add_unit/add_collection for " +
                                std::string{ node_kind_name(kind) } + " nodes");
  }
  insert_node(id, kind, name);
}

memory_graph::node const &memory_graph::require_node(std::string_view id) const {
  auto const it{ nodes_.find(id) };
  if (it == nodes_.end()) {
    throw std::invalid_argument("memory_graph: unknown node: " + std::string{ id });
  }
  return it->second;
}

std::vector<std::string> memory_graph::find_path(std::string_view from_id,
                                                 std::string_view to_id) const {
  // Depth-first search recording the path; returns ids from `from_id` to `to_id`.
  std::vector<std::string> path{ std::string{ from_id } };
  std::unordered_set<std::string> visited{ std::string{ from_id } };
  std::vector<std::size_t> next_child{ 0 };

  while (!path.empty()) {
    if (path.back() == to_id) { return path; }

    auto const children_it{ children_.find(path.back()) };
    std::size_t &cursor{ next_child.back() };
    if (children_it == children_.end() || cursor >= children_it->second.size()) {
      path.pop_back();
      next_child.pop_back();
      continue;
    }

    std::string const &child{ children_it->second[cursor++] };
    if (visited.insert(child).second) {
      path.push_back(child);
      next_child.push_back(0);
    }
  }
  return {};
}

bool memory_graph::reaches(std::string_view from_id, std::string_view to_id) const {
  return !find_path(from_id, to_id).empty();
}

void memory_graph::add_contains(std::string const &parent_id, std::string const &child_id) {
  node const &parent{ require_node(parent_id) };
  require_node(child_id);

  if (auto const path{ find_path(child_id, parent_id) }; !path.empty()) {
    std::string cycle{ parent.name.empty() ? parent_id : parent.name };
    for (auto const &id : path) {
      auto const &n{ nodes_.find(id)->second };
      cycle += " -> " + (n.name.empty() ? id : n.name);
    }
    throw circular_dependency_error{ cycle };
  }

  auto &siblings{ children_[parent_id] };
  if (std::find(siblings.begin(), siblings.end(), child_id) != siblings.end()) { return; }
  siblings.push_back(child_id);
}

void memory_graph::add_relates(std::string const &a,
                               std::string const &b,
                               std::map<std::string, std::string> properties) {
  require_node(a);
  require_node(b);
  relations_.push_back(relates_edge{ .a = a, .b = b, .properties = std::move(properties) });
}

std::vector<relates_edge> memory_graph::list_relations(std::string_view id) const {
  std::vector<relates_edge> result;
  for (auto const &edge : relations_) {
    if (edge.a == id || edge.b == id) { result.push_back(edge); }
  }
  return result;
}

std::size_t memory_graph::edge_count() const {
  std::size_t count{ 0 };
  for (auto const &[_, children] : children_) { count += children.size(); }
  return count;
}

std::vector<function_unit const *> memory_graph::find_units(std::string_view name) const {
  std::vector<function_unit const *> result;
  for (auto const &[_, unit] : units_) {
    if (unit.name == name) { result.push_back(&unit); }
  }
  return result;
}

function_unit const *memory_graph::get_unit(std::string_view id) const {
  auto const it{ units_.find(id) };
  return it == units_.end() ? nullptr : &it->second;
}

variable_collection const *memory_graph::get_collection(std::string_view id) const {
  auto const it{ collections_.find(id) };
  return it == collections_.end() ? nullptr : &it->second;
}

std::vector<variable_collection const *> memory_graph::find_collection(
    std::string_view name) const {
  std::vector<variable_collection const *> result;
  for (auto const &[_, collection] : collections_) {
    if (collection.name == name) { result.push_back(&collection); }
  }
  return result;
}

std::vector<contains_edge> memory_graph::list_children(std::string_view parent_id) const {
  std::vector<contains_edge> result;
  auto const it{ children_.find(parent_id) };
  if (it == children_.end()) { return result; }

  result.reserve(it->second.size());
  for (auto const &child_id : it->second) {
    result.push_back(contains_edge{ .parent_id = it->first,
                                    .child_id = child_id,
                                    .child_kind = nodes_.find(child_id)->second.kind });
  }
  return result;
}

}  // namespace skillet
