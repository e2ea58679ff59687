#pragma once

#include "util.h"

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace skillet {

enum class node_kind { skill, knowledge, function, collection };

std::string_view node_kind_name(node_kind kind);

struct function_unit {
  std::string id;
  std::string name;
  std::string description;
  std::string signature;
  std::string body;  // inline dependency header plus top-level definitions
};

// Ordered name -> value pairs; order is declaration order.
using variable_list = std::vector<std::pair<std::string, std::string>>;

struct variable_collection {
  std::string id;
  std::string name;
  std::string description;
  variable_list variables;
};

struct contains_edge {
  std::string parent_id;
  std::string child_id;
  node_kind child_kind;
};

struct relates_edge {
  std::string a;
  std::string b;
  std::map<std::string, std::string> properties;
};

// Read-only view of the function graph consumed by the pipeline. Implementations must
// be safe for concurrent readers.
class graph_reader {
 public:
  virtual ~graph_reader() = default;

  // Zero, one or many units carrying `name`.
  virtual std::vector<function_unit const *> find_units(std::string_view name) const = 0;
  virtual function_unit const *get_unit(std::string_view id) const = 0;
  virtual variable_collection const *get_collection(std::string_view id) const = 0;
  virtual std::vector<variable_collection const *> find_collection(
      std::string_view name) const = 0;

  // Contains-edges whose parent is `parent_id`, in insertion order.
  virtual std::vector<contains_edge> list_children(std::string_view parent_id) const = 0;
};

// In-memory graph. Contains-edges that would close a cycle are rejected before
// insertion, so the contains-graph is always acyclic.
class memory_graph : public graph_reader, unmovable {
 public:
  void add_unit(function_unit unit);
  void add_collection(variable_collection collection);
  void add_node(std::string id, node_kind kind, std::string name);  // skill or knowledge

  // Throws circular_dependency_error (graph unchanged) when `child_id` already reaches
  // `parent_id`, self edges included. Re-adding an existing edge is a no-op.
  void add_contains(std::string const &parent_id, std::string const &child_id);
  void add_relates(std::string const &a,
                   std::string const &b,
                   std::map<std::string, std::string> properties = {});

  bool reaches(std::string_view from_id, std::string_view to_id) const;
  std::vector<relates_edge> list_relations(std::string_view id) const;
  std::size_t node_count() const { return nodes_.size(); }
  std::size_t edge_count() const;

  std::vector<function_unit const *> find_units(std::string_view name) const override;
  function_unit const *get_unit(std::string_view id) const override;
  variable_collection const *get_collection(std::string_view id) const override;
  std::vector<variable_collection const *> find_collection(
      std::string_view name) const override;
  std::vector<contains_edge> list_children(std::string_view parent_id) const override;

 private:
  struct node {
    node_kind kind;
    std::string name;
  };

  node const &require_node(std::string_view id) const;
  void insert_node(std::string const &id, node_kind kind, std::string const &name);
  std::vector<std::string> find_path(std::string_view from_id, std::string_view to_id) const;

  std::map<std::string, node, std::less<>> nodes_;
  std::map<std::string, function_unit, std::less<>> units_;
  std::map<std::string, variable_collection, std::less<>> collections_;
  std::map<std::string, std::vector<std::string>, std::less<>> children_;
  std::vector<relates_edge> relations_;
};

}  // namespace skillet
