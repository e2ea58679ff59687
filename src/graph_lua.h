#pragma once

#include "graph.h"

#include <filesystem>
#include <memory>
#include <string_view>

namespace skillet {

// Build a graph from a Lua graph file declaring FUNCTIONS, COLLECTIONS, SKILLS,
// KNOWLEDGE, CONTAINS and RELATES. Every failure, including a rejected cyclic
// CONTAINS edge, is a graph_load_error naming the file.
std::unique_ptr<memory_graph> graph_lua_load(std::filesystem::path const &path);

// `base_dir` anchors relative body_file paths.
std::unique_ptr<memory_graph> graph_lua_parse(std::string_view script,
                                              std::filesystem::path const &base_dir,
                                              std::string_view source_name);

}  // namespace skillet
