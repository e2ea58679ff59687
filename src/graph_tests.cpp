#include "graph.h"

#include "errors.h"

#include "doctest.h"

#include <random>
#include <string>
#include <vector>

namespace {

skillet::function_unit make_unit(std::string id, std::string name) {
  return skillet::function_unit{ .id = std::move(id),
                                 .name = std::move(name),
                                 .description = {},
                                 .signature = {},
                                 .body = {} };
}

// Kahn's algorithm over the graph's contains-edges.
bool is_acyclic(skillet::memory_graph const &g, std::vector<std::string> const &ids) {
  std::map<std::string, int> indegree;
  for (auto const &id : ids) { indegree[id] = 0; }
  for (auto const &id : ids) {
    for (auto const &edge : g.list_children(id)) { ++indegree[edge.child_id]; }
  }

  std::vector<std::string> ready;
  for (auto const &[id, degree] : indegree) {
    if (degree == 0) { ready.push_back(id); }
  }

  std::size_t visited{ 0 };
  while (!ready.empty()) {
    auto const id{ ready.back() };
    ready.pop_back();
    ++visited;
    for (auto const &edge : g.list_children(id)) {
      if (--indegree[edge.child_id] == 0) { ready.push_back(edge.child_id); }
    }
  }
  return visited == ids.size();
}

}  // namespace

TEST_CASE("memory_graph stores units and collections") {
  skillet::memory_graph g;
  g.add_unit(make_unit("u1", "fetch"));
  g.add_collection(skillet::variable_collection{ .id = "c1",
                                                 .name = "creds",
                                                 .description = "api creds",
                                                 .variables = { { "API_KEY", "abc" } } });

  REQUIRE(g.get_unit("u1") != nullptr);
  CHECK(g.get_unit("u1")->name == "fetch");
  CHECK(g.get_unit("missing") == nullptr);
  REQUIRE(g.get_collection("c1") != nullptr);
  CHECK(g.get_collection("c1")->variables.size() == 1);
  CHECK(g.find_units("fetch").size() == 1);
  CHECK(g.find_units("nope").empty());
  CHECK(g.find_collection("creds").size() == 1);
  CHECK(g.node_count() == 2);
}

TEST_CASE("memory_graph rejects duplicate ids") {
  skillet::memory_graph g;
  g.add_unit(make_unit("u1", "a"));
  CHECK_THROWS_AS(g.add_unit(make_unit("u1", "b")), std::invalid_argument);
  CHECK_THROWS_AS(g.add_node("u1", skillet::node_kind::skill, "s"), std::invalid_argument);
}

TEST_CASE("memory_graph finds duplicate names as separate units") {
  skillet::memory_graph g;
  g.add_unit(make_unit("u1", "parse"));
  g.add_unit(make_unit("u2", "parse"));
  CHECK(g.find_units("parse").size() == 2);
}

TEST_CASE("memory_graph lists children in insertion order with kinds") {
  skillet::memory_graph g;
  g.add_node("s", skillet::node_kind::skill, "scraping");
  g.add_unit(make_unit("u2", "b"));
  g.add_unit(make_unit("u1", "a"));
  g.add_collection(skillet::variable_collection{ .id = "c", .name = "vars" });

  g.add_contains("s", "u2");
  g.add_contains("s", "c");
  g.add_contains("s", "u1");
  g.add_contains("s", "u2");  // duplicate is a no-op

  auto const children{ g.list_children("s") };
  REQUIRE(children.size() == 3);
  CHECK(children[0].child_id == "u2");
  CHECK(children[0].child_kind == skillet::node_kind::function);
  CHECK(children[1].child_id == "c");
  CHECK(children[1].child_kind == skillet::node_kind::collection);
  CHECK(children[2].child_id == "u1");
  CHECK(g.list_children("u1").empty());
  CHECK(g.edge_count() == 3);
}

TEST_CASE("memory_graph rejects self edges") {
  skillet::memory_graph g;
  g.add_unit(make_unit("u1", "a"));
  CHECK_THROWS_WITH_AS(g.add_contains("u1", "u1"),
                       "Circular dependency detected: a -> a",
                       skillet::circular_dependency_error);
  CHECK(g.edge_count() == 0);
}

TEST_CASE("memory_graph rejects edges closing a cycle and leaves graph unchanged") {
  skillet::memory_graph g;
  g.add_unit(make_unit("a", "a"));
  g.add_unit(make_unit("b", "b"));
  g.add_unit(make_unit("c", "c"));
  g.add_contains("a", "b");
  g.add_contains("b", "c");

  try {
    g.add_contains("c", "a");
    FAIL("expected circular_dependency_error");
  } catch (skillet::circular_dependency_error const &e) {
    CHECK(e.cycle == "c -> a -> b -> c");
  }

  CHECK(g.edge_count() == 2);
  CHECK(g.list_children("c").empty());
  CHECK(g.reaches("a", "c"));
  CHECK_FALSE(g.reaches("c", "a"));
}

TEST_CASE("memory_graph allows diamonds") {
  skillet::memory_graph g;
  for (auto const *id : { "top", "left", "right", "bottom" }) { g.add_unit(make_unit(id, id)); }
  g.add_contains("top", "left");
  g.add_contains("top", "right");
  g.add_contains("left", "bottom");
  CHECK_NOTHROW(g.add_contains("right", "bottom"));
  CHECK(g.edge_count() == 4);
}

TEST_CASE("memory_graph rejects edges to unknown nodes") {
  skillet::memory_graph g;
  g.add_unit(make_unit("a", "a"));
  CHECK_THROWS_AS(g.add_contains("a", "ghost"), std::invalid_argument);
  CHECK_THROWS_AS(g.add_contains("ghost", "a"), std::invalid_argument);
}

TEST_CASE("memory_graph keeps relates edges out of traversal") {
  skillet::memory_graph g;
  g.add_unit(make_unit("a", "a"));
  g.add_node("k", skillet::node_kind::knowledge, "notes");
  g.add_relates("a", "k", { { "why", "docs" } });
  g.add_relates("k", "a");

  CHECK(g.list_children("a").empty());
  CHECK(g.list_relations("a").size() == 2);
  CHECK(g.list_relations("k")[0].properties.at("why") == "docs");
}

TEST_CASE("memory_graph stays acyclic under random edge insertion") {
  std::mt19937 rng{ 20240611u };

  for (int round{ 0 }; round < 20; ++round) {
    skillet::memory_graph g;
    std::vector<std::string> ids;
    for (int i{ 0 }; i < 12; ++i) {
      ids.push_back("n" + std::to_string(i));
      g.add_unit(make_unit(ids.back(), ids.back()));
    }

    std::uniform_int_distribution<std::size_t> pick{ 0, ids.size() - 1 };
    for (int attempt{ 0 }; attempt < 60; ++attempt) {
      auto const &parent{ ids[pick(rng)] };
      auto const &child{ ids[pick(rng)] };
      bool const would_cycle{ parent == child || g.reaches(child, parent) };
      auto const before{ g.edge_count() };

      if (would_cycle) {
        CHECK_THROWS_AS(g.add_contains(parent, child), skillet::circular_dependency_error);
        CHECK(g.edge_count() == before);
      } else {
        CHECK_NOTHROW(g.add_contains(parent, child));
      }
    }

    CHECK(is_acyclic(g, ids));
  }
}

TEST_CASE("node_kind_name") {
  CHECK(skillet::node_kind_name(skillet::node_kind::skill) == "skill");
  CHECK(skillet::node_kind_name(skillet::node_kind::collection) == "collection");
}
