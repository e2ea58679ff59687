#include "secret_store.h"

#include "platform.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace skillet {

namespace {

bool needs_quotes(std::string_view value) {
  return std::any_of(value.begin(), value.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '#' || c == '$' || c == '"' ||
           c == '\'' || c == '\\';
  });
}

void validate_collection_id(std::string_view id) {
  bool const valid{ !id.empty() && id.front() != '.' &&
                    std::all_of(id.begin(), id.end(), [](char c) {
                      return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
                             c == '_' || c == '.';
                    }) };
  if (!valid) {
    throw std::invalid_argument("invalid collection id for secret store: '" +
                                std::string{ id } + "'");
  }
}

std::string decode_quoted(std::string_view rest, std::size_t line_no) {
  auto const fail{ [&](char const *what) {
    throw std::runtime_error("line " + std::to_string(line_no) + ": " + what);
  } };

  std::string value;
  std::size_t i{ 1 };
  for (; i < rest.size() && rest[i] != '"'; ++i) {
    if (rest[i] != '\\') {
      value.push_back(rest[i]);
      continue;
    }
    if (++i >= rest.size()) { break; }
    switch (rest[i]) {
      case 'n': value.push_back('\n'); break;
      case '"': value.push_back('"'); break;
      case '\\': value.push_back('\\'); break;
      default: fail("unsupported escape sequence");
    }
  }
  if (i >= rest.size()) { fail("unterminated quoted value"); }

  auto const trailing{ util_trim(rest.substr(i + 1)) };
  if (!trailing.empty() && !trailing.starts_with('#')) { fail("text after quoted value"); }
  return value;
}

}  // namespace

std::string secret_store_encode(variable_list const &variables) {
  std::string out;
  for (auto const &[key, value] : variables) {
    out += key;
    out.push_back('=');
    if (!needs_quotes(value)) {
      out += value;
    } else {
      out.push_back('"');
      for (char const c : value) {
        switch (c) {
          case '\\': out += "\\\\"; break;
          case '"': out += "\\\""; break;
          case '\n': out += "\\n"; break;
          default: out.push_back(c); break;
        }
      }
      out.push_back('"');
    }
    out.push_back('\n');
  }
  return out;
}

variable_list secret_store_decode(std::string_view text) {
  variable_list result;
  std::size_t line_no{ 0 };

  for (auto const raw : util_split_lines(text)) {
    ++line_no;
    auto const line{ util_trim(raw) };
    if (line.empty() || line.starts_with('#')) { continue; }

    auto const eq{ line.find('=') };
    if (eq == std::string_view::npos) {
      throw std::runtime_error("line " + std::to_string(line_no) + ": expected key=value");
    }

    auto const key{ util_trim(line.substr(0, eq)) };
    if (key.empty()) {
      throw std::runtime_error("line " + std::to_string(line_no) + ": empty key");
    }

    auto const rest{ util_trim(line.substr(eq + 1)) };
    std::string value{ rest.starts_with('"') ? decode_quoted(rest, line_no)
                                             : std::string{ rest } };

    auto const existing{ std::find_if(result.begin(), result.end(), [&](auto const &kv) {
      return kv.first == key;
    }) };
    if (existing != result.end()) {
      existing->second = std::move(value);
    } else {
      result.emplace_back(std::string{ key }, std::move(value));
    }
  }
  return result;
}

secret_store::secret_store(std::filesystem::path root) : root_{ std::move(root) } {}

std::filesystem::path secret_store::file_for(std::string_view collection_id) const {
  validate_collection_id(collection_id);
  return root_ / (std::string{ collection_id } + ".env");
}

std::optional<variable_list> secret_store::read(std::string_view collection_id) const {
  auto const path{ file_for(collection_id) };
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) { return std::nullopt; }

  if (!platform::is_owner_only(path)) {
    tui::warn("Secret file %s is readable by other users; expected mode 0600",
              path.string().c_str());
  }

  try {
    return secret_store_decode(util_load_text(path));
  } catch (std::runtime_error const &e) {
    throw std::runtime_error("secret store file " + path.string() + ": " + e.what());
  }
}

void secret_store::write_locked(std::string_view collection_id,
                                variable_list const &variables) const {
  auto const path{ file_for(collection_id) };
  platform::write_private_file(path, secret_store_encode(variables));
  tui::debug("Wrote %zu variable(s) to %s", variables.size(), path.string().c_str());
  SKILLET_TRACE_SECRET_FILE_WRITTEN(std::string{ collection_id },
                                    path.string(),
                                    variables.size());
}

void secret_store::write(std::string_view collection_id,
                         variable_list const &variables) const {
  validate_collection_id(collection_id);
  platform::ensure_private_directory(root_);
  platform::file_lock const lock{ root_ / (std::string{ collection_id } + ".lock") };
  write_locked(collection_id, variables);
}

std::size_t secret_store::persist_missing(std::string_view collection_id,
                                          variable_list const &variables) const {
  if (variables.empty()) { return 0; }

  validate_collection_id(collection_id);
  platform::ensure_private_directory(root_);
  platform::file_lock const lock{ root_ / (std::string{ collection_id } + ".lock") };

  auto current{ read(collection_id).value_or(variable_list{}) };
  std::size_t added{ 0 };
  for (auto const &[key, value] : variables) {
    bool const present{ std::any_of(current.begin(), current.end(), [&](auto const &kv) {
      return kv.first == key;
    }) };
    if (!present) {
      current.emplace_back(key, value);
      ++added;
    }
  }

  if (added) { write_locked(collection_id, current); }
  return added;
}

}  // namespace skillet
