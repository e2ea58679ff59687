#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillet::platform {

// Exclusive advisory lock on `path` (created if missing). Also serializes threads of
// this process on the same path, which fcntl locks alone do not.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// Create `dir` (and parents) and restrict it to the owner (0700).
void ensure_private_directory(std::filesystem::path const &dir);

// Write `content` to a 0600 temp file beside `target`, fsync, then rename over `target`.
void write_private_file(std::filesystem::path const &target, std::string_view content);

// False when group or other permission bits are set on `path`.
bool is_owner_only(std::filesystem::path const &path);

// $XDG_DATA_HOME/skillet or ~/.local/share/skillet
std::optional<std::filesystem::path> get_default_data_root();

// $SKILLET_CONFIG, else $XDG_CONFIG_HOME/skillet/config.lua or
// ~/.config/skillet/config.lua. Returned path may not exist.
std::optional<std::filesystem::path> get_default_config_path();

// Expand ~ and $VAR references. Throws on undefined variables.
std::filesystem::path expand_path(std::string_view p);

std::optional<std::string> get_env_var(char const *name);

bool is_tty();

}  // namespace skillet::platform
