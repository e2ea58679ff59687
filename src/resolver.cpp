#include "resolver.h"

#include "errors.h"
#include "script_meta.h"
#include "trace.h"
#include "tui.h"

#include <deque>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace skillet {

namespace {

function_unit const &lookup(graph_reader const &graph,
                            std::string const &name,
                            function_unit const *required_by) {
  auto const matches{ graph.find_units(name) };
  if (matches.size() == 1) { return *matches.front(); }

  std::string detail;
  if (matches.empty()) {
    detail = "no function unit has this name";
  } else {
    detail = "name is ambiguous (" + std::to_string(matches.size()) + " units)";
  }
  if (required_by) { detail += ", required by '" + required_by->name + "'"; }
  throw unresolved_reference_error{ name, detail };
}

using adjacency = std::unordered_map<std::string, std::vector<std::string>>;

// Depth-first colouring over the discovered edges.
void check_cycles(adjacency const &edges,
                  std::vector<std::string> const &order,
                  std::unordered_map<std::string, std::string> const &names) {
  enum class colour { white, gray, black };
  std::unordered_map<std::string, colour> state;

  struct frame {
    std::string id;
    std::size_t next;
  };

  for (auto const &root : order) {
    if (state[root] != colour::white) { continue; }

    std::vector<frame> stack{ frame{ .id = root, .next = 0 } };
    state[root] = colour::gray;

    while (!stack.empty()) {
      auto &top{ stack.back() };
      auto const it{ edges.find(top.id) };
      if (it == edges.end() || top.next >= it->second.size()) {
        state[top.id] = colour::black;
        stack.pop_back();
        continue;
      }

      std::string const child{ it->second[top.next++] };
      colour &child_state{ state[child] };
      if (child_state == colour::gray) {
        std::string cycle;
        bool on_cycle{ false };
        for (auto const &f : stack) {
          if (f.id == child) { on_cycle = true; }
          if (on_cycle) { cycle += names.at(f.id) + " -> "; }
        }
        cycle += names.at(child);
        throw circular_dependency_error{ cycle };
      }
      if (child_state == colour::white) {
        child_state = colour::gray;
        stack.push_back(frame{ .id = child, .next = 0 });
      }
    }
  }
}

}  // namespace

std::vector<std::string> resolution_plan::function_names() const {
  std::vector<std::string> result;
  result.reserve(functions.size());
  for (auto const &unit : functions) { result.push_back(unit.name); }
  return result;
}

resolution_plan resolve(graph_reader const &graph, std::vector<std::string> const &names) {
  resolution_plan plan;

  std::deque<function_unit const *> queue;
  std::unordered_set<std::string> enqueued;
  std::unordered_set<std::string> collected;
  std::unordered_map<std::string, std::string> unit_names;
  adjacency edges;
  std::vector<std::string> roots;

  auto const enqueue{ [&](function_unit const &unit) {
    unit_names.emplace(unit.id, unit.name);
    if (enqueued.insert(unit.id).second) { queue.push_back(&unit); }
  } };

  for (auto const &name : names) {
    auto const &unit{ lookup(graph, name, nullptr) };
    roots.push_back(unit.id);
    enqueue(unit);
  }

  while (!queue.empty()) {
    function_unit const &unit{ *queue.front() };
    queue.pop_front();
    plan.visited.push_back(unit.id);
    plan.functions.push_back(unit);

    auto &out_edges{ edges[unit.id] };

    for (auto const &edge : graph.list_children(unit.id)) {
      if (edge.child_kind == node_kind::collection) {
        if (!collected.insert(edge.child_id).second) { continue; }
        auto const *collection{ graph.get_collection(edge.child_id) };
        if (!collection) {
          throw std::runtime_error("graph lists collection '" + edge.child_id +
                                   "' under '" + unit.name + "' but cannot return it");
        }
        plan.collections.push_back(*collection);
      } else if (edge.child_kind == node_kind::function) {
        auto const *child{ graph.get_unit(edge.child_id) };
        if (!child) {
          throw std::runtime_error("graph lists function '" + edge.child_id + "' under '" +
                                   unit.name + "' but cannot return it");
        }
        out_edges.push_back(child->id);
        enqueue(*child);
      }
    }

    for (auto const &required : script_meta_requires(unit.body)) {
      auto const &child{ lookup(graph, required, &unit) };
      out_edges.push_back(child.id);
      enqueue(child);
    }
  }

  check_cycles(edges, roots, unit_names);

  tui::debug("Resolved %zu function(s) and %zu collection(s)",
             plan.functions.size(),
             plan.collections.size());

  if (tui::trace_enabled()) {
    std::string joined;
    for (auto const &unit : plan.functions) {
      if (!joined.empty()) { joined += ","; }
      joined += unit.name;
    }
    SKILLET_TRACE_PLAN_RESOLVED(joined, plan.functions.size(), plan.collections.size());
  }

  return plan;
}

}  // namespace skillet
