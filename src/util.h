#pragma once

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace skillet {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory. Throws std::runtime_error if it cannot be read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);
std::string util_load_text(std::filesystem::path const &path);

// Strip leading and trailing spaces, tabs, CR and LF.
std::string_view util_trim(std::string_view s);

std::string util_to_lower(std::string_view s);

// Split on '\n'; a trailing '\r' is kept on each line. An empty input yields no lines,
// a trailing newline does not yield a final empty line.
std::vector<std::string_view> util_split_lines(std::string_view text);

// Split on ',' and trim each piece; empty pieces are dropped.
std::vector<std::string> util_split_csv(std::string_view text);

// Append `value` to `out` with JSON string escaping (no surrounding quotes).
void util_append_json_string(std::string &out, std::string_view value);

// Removes the path (recursively) on destruction unless reset to empty.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace skillet
