#pragma once

#include "graph.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace skillet {

// Restricted per-collection variable files: <root>/<collection id>.env, one key=value
// per line, mode 0600 inside a 0700 directory. Writes to one collection are serialized
// across threads and processes and replace the file atomically.
class secret_store {
 public:
  explicit secret_store(std::filesystem::path root);

  std::filesystem::path const &root() const { return root_; }
  std::filesystem::path file_for(std::string_view collection_id) const;

  // nullopt when the collection has no file.
  std::optional<variable_list> read(std::string_view collection_id) const;

  void write(std::string_view collection_id, variable_list const &variables) const;

  // Add entries whose keys the file lacks; existing keys keep their stored value.
  // Returns the number of entries added.
  std::size_t persist_missing(std::string_view collection_id,
                              variable_list const &variables) const;

 private:
  void write_locked(std::string_view collection_id, variable_list const &variables) const;

  std::filesystem::path root_;
};

std::string secret_store_encode(variable_list const &variables);

// Throws std::runtime_error naming the line on malformed input.
variable_list secret_store_decode(std::string_view text);

}  // namespace skillet
