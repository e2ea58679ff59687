#include "util.h"

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace skillet {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_load_text(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ bytes.begin(), bytes.end() };
}

std::string_view util_trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\r\n") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\r\n") - start + 1);
}

std::string util_to_lower(std::string_view s) {
  std::string result{ s };
  for (char &c : result) {
    if (c >= 'A' && c <= 'Z') { c = static_cast<char>(c - 'A' + 'a'); }
  }
  return result;
}

std::vector<std::string_view> util_split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t line_start{ 0 };

  while (line_start < text.size()) {
    size_t const line_end{ text.find('\n', line_start) };
    if (line_end == std::string_view::npos) {
      lines.push_back(text.substr(line_start));
      break;
    }
    lines.push_back(text.substr(line_start, line_end - line_start));
    line_start = line_end + 1;
  }

  return lines;
}

std::vector<std::string> util_split_csv(std::string_view text) {
  std::vector<std::string> result;
  for (std::string_view sv{ text }; !sv.empty();) {
    auto const pos{ sv.find(',') };
    auto const token{ util_trim(sv.substr(0, pos)) };
    if (!token.empty()) { result.emplace_back(token); }
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
  }
  return result;
}

void util_append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;  // best effort; the path may already be gone
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace skillet
