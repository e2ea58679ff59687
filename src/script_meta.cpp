#include "script_meta.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <variant>

namespace skillet {

namespace {

constexpr std::string_view kBlockStart{ "# /// script" };
constexpr std::string_view kBlockEnd{ "# ///" };

std::string_view strip_cr(std::string_view line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
    line.remove_suffix(1);
  }
  return line;
}

struct header_span {
  std::size_t first;  // index of "# /// script"
  std::size_t last;   // index of "# ///"
};

std::optional<header_span> find_header(std::vector<std::string_view> const &lines) {
  std::optional<header_span> found;

  for (std::size_t i{ 0 }; i < lines.size(); ++i) {
    if (strip_cr(lines[i]) != kBlockStart) { continue; }
    if (found) { throw std::invalid_argument("multiple script metadata blocks"); }

    std::size_t j{ i + 1 };
    for (; j < lines.size(); ++j) {
      auto const line{ strip_cr(lines[j]) };
      if (line == kBlockEnd) { break; }
      if (line != "#" && !line.starts_with("# ")) { j = lines.size(); }
    }
    if (j >= lines.size()) { throw std::invalid_argument("unterminated script metadata block"); }

    found = header_span{ .first = i, .last = j };
    i = j;
  }
  return found;
}

// TOML subset: root keys, [tool.*] tables (skipped), strings, arrays, bare scalars,
// inline tables, comments.
class toml_reader {
 public:
  using value = std::variant<std::monostate, std::string, std::vector<std::string>>;

  explicit toml_reader(std::string_view text) : text_{ text } {}

  script_header read() {
    script_header header;
    bool in_root{ true };
    bool seen_python{ false };
    bool seen_deps{ false };

    for (;;) {
      skip_space(true);
      if (eof()) { break; }

      if (peek() == '[') {
        in_root = false;
        auto const table{ read_table_header() };
        if (table != "tool" && !table.starts_with("tool.")) {
          fail("unsupported table [" + std::string{ table } + "]");
        }
        continue;
      }

      auto const key{ read_key() };
      skip_space(false);
      expect('=');
      skip_space(false);
      auto v{ read_value() };
      end_of_line();

      if (!in_root) { continue; }

      if (key == "requires-python") {
        if (seen_python) { fail("duplicate key requires-python"); }
        seen_python = true;
        auto *s{ std::get_if<std::string>(&v) };
        if (!s) { fail("requires-python must be a string"); }
        header.requires_python = std::move(*s);
      } else if (key == "dependencies") {
        if (seen_deps) { fail("duplicate key dependencies"); }
        seen_deps = true;
        auto *list{ std::get_if<std::vector<std::string>>(&v) };
        if (!list) { fail("dependencies must be an array of strings"); }
        header.dependencies = std::move(*list);
      }
    }
    return header;
  }

 private:
  [[noreturn]] void fail(std::string const &msg) const {
    throw std::invalid_argument("script metadata: " + msg);
  }

  bool eof() const { return pos_ >= text_.size(); }
  char peek() const { return text_[pos_]; }

  void skip_space(bool newlines) {
    while (!eof()) {
      char const c{ peek() };
      if (c == ' ' || c == '\t' || c == '\r') {
        ++pos_;
      } else if (c == '\n' && newlines) {
        ++pos_;
      } else if (c == '#') {
        while (!eof() && peek() != '\n') { ++pos_; }
      } else {
        break;
      }
    }
  }

  void expect(char c) {
    if (eof() || peek() != c) { fail(std::string{ "expected '" } + c + "'"); }
    ++pos_;
  }

  void end_of_line() {
    skip_space(false);
    if (!eof() && peek() != '\n') { fail("unexpected text after value"); }
  }

  std::string_view read_table_header() {
    expect('[');
    auto const close{ text_.find(']', pos_) };
    if (close == std::string_view::npos) { fail("unterminated table header"); }
    auto const name{ util_trim(text_.substr(pos_, close - pos_)) };
    pos_ = close + 1;
    end_of_line();
    return name;
  }

  std::string read_key() {
    if (peek() == '"' || peek() == '\'') { return read_string(); }

    std::size_t const start{ pos_ };
    while (!eof() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '-' ||
                      peek() == '_' || peek() == '.')) {
      ++pos_;
    }
    if (start == pos_) { fail("expected key"); }
    return std::string{ text_.substr(start, pos_ - start) };
  }

  std::string read_string() {
    char const quote{ peek() };
    ++pos_;
    std::string result;
    while (!eof() && peek() != quote) {
      char const c{ peek() };
      if (c == '\n') { fail("newline in string"); }
      if (c == '\\' && quote == '"') {
        ++pos_;
        if (eof()) { break; }
        switch (peek()) {
          case 'n': result.push_back('\n'); break;
          case 't': result.push_back('\t'); break;
          case '"': result.push_back('"'); break;
          case '\\': result.push_back('\\'); break;
          default: fail(std::string{ "unsupported escape \\" } + peek());
        }
        ++pos_;
        continue;
      }
      result.push_back(c);
      ++pos_;
    }
    if (eof()) { fail("unterminated string"); }
    ++pos_;
    return result;
  }

  value read_value() {
    if (eof()) { fail("expected value"); }

    char const c{ peek() };
    if (c == '"' || c == '\'') { return read_string(); }
    if (c == '[') { return read_array(); }
    if (c == '{') {
      skip_inline_table();
      return std::monostate{};
    }

    std::size_t const start{ pos_ };
    while (!eof() && peek() != '\n' && peek() != ',' && peek() != ']' && peek() != '#' &&
           peek() != ' ' && peek() != '\t' && peek() != '\r') {
      ++pos_;
    }
    if (start == pos_) { fail("expected value"); }
    return std::monostate{};
  }

  value read_array() {
    expect('[');
    std::vector<std::string> items;
    bool all_strings{ true };

    for (;;) {
      skip_space(true);
      if (eof()) { fail("unterminated array"); }
      if (peek() == ']') {
        ++pos_;
        break;
      }

      auto item{ read_value() };
      if (auto *s{ std::get_if<std::string>(&item) }) {
        items.push_back(std::move(*s));
      } else {
        all_strings = false;
      }

      skip_space(true);
      if (eof()) { fail("unterminated array"); }
      if (peek() == ',') {
        ++pos_;
      } else if (peek() != ']') {
        fail("expected ',' or ']' in array");
      }
    }

    if (!all_strings) { return std::monostate{}; }
    return items;
  }

  void skip_inline_table() {
    int depth{ 0 };
    while (!eof()) {
      char const c{ peek() };
      if (c == '"' || c == '\'') {
        read_string();
        continue;
      }
      ++pos_;
      if (c == '{') { ++depth; }
      if (c == '}' && --depth == 0) { return; }
    }
    fail("unterminated inline table");
  }

  std::string_view text_;
  std::size_t pos_{ 0 };
};

// For each line, whether it begins inside a triple-quoted string.
std::vector<bool> triple_string_state(std::vector<std::string_view> const &lines) {
  std::vector<bool> result;
  result.reserve(lines.size());

  std::string_view open;  // active triple delimiter, empty when none
  for (auto const line : lines) {
    result.push_back(!open.empty());

    std::size_t i{ 0 };
    while (i < line.size()) {
      if (!open.empty()) {
        if (line[i] == '\\') {
          i += 2;
        } else if (line.substr(i).starts_with(open)) {
          i += 3;
          open = {};
        } else {
          ++i;
        }
        continue;
      }

      char const c{ line[i] };
      if (c == '#') { break; }
      if (c == '"' || c == '\'') {
        auto const rest{ line.substr(i) };
        if (rest.starts_with("\"\"\"") || rest.starts_with("'''")) {
          open = c == '"' ? std::string_view{ "\"\"\"" } : std::string_view{ "'''" };
          i += 3;
          continue;
        }
        ++i;
        while (i < line.size() && line[i] != c) { i += line[i] == '\\' ? 2 : 1; }
        ++i;
        continue;
      }
      ++i;
    }
  }
  return result;
}

bool is_main_guard(std::string_view line) {
  if (!line.starts_with("if")) { return false; }

  std::string compact;
  for (char const c : line) {
    if (c == '#') { break; }
    if (c != ' ' && c != '\t' && c != '\r') { compact.push_back(c); }
  }

  return compact == "if__name__==\"__main__\":" || compact == "if__name__=='__main__':" ||
         compact == "if\"__main__\"==__name__:" || compact == "if'__main__'==__name__:";
}

std::string join_lines(std::vector<std::string_view> const &lines) {
  std::string result;
  for (auto const line : lines) {
    result.append(line);
    result.push_back('\n');
  }
  return result;
}

std::string_view identifier_at(std::string_view text) {
  std::size_t n{ 0 };
  while (n < text.size() &&
         (std::isalnum(static_cast<unsigned char>(text[n])) || text[n] == '_')) {
    ++n;
  }
  if (n == 0 || std::isdigit(static_cast<unsigned char>(text[0]))) { return {}; }
  return text.substr(0, n);
}

}  // namespace

script_header script_meta_parse(std::string_view source) {
  auto const lines{ util_split_lines(source) };
  auto const span{ find_header(lines) };
  if (!span) { throw std::invalid_argument("missing '# /// script' metadata block"); }

  std::string toml;
  for (std::size_t i{ span->first + 1 }; i < span->last; ++i) {
    auto const line{ strip_cr(lines[i]) };
    toml.append(line.size() > 1 ? line.substr(2) : std::string_view{});
    toml.push_back('\n');
  }

  return toml_reader{ toml }.read();
}

std::string script_meta_strip_header(std::string_view source) {
  auto lines{ util_split_lines(source) };
  if (auto const span{ find_header(lines) }) {
    lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(span->first),
                lines.begin() + static_cast<std::ptrdiff_t>(span->last) + 1);
  }
  return join_lines(lines);
}

std::string script_meta_render_header(std::optional<std::string> const &requires_python,
                                      std::vector<std::string> const &dependencies) {
  std::string out{ kBlockStart };
  out.push_back('\n');

  if (requires_python) {
    out.append("# requires-python = \"");
    out.append(*requires_python);
    out.append("\"\n");
  }

  if (dependencies.empty()) {
    out.append("# dependencies = []\n");
  } else {
    out.append("# dependencies = [\n");
    for (auto const &dep : dependencies) {
      out.append("#   \"");
      for (char const c : dep) {
        if (c == '"' || c == '\\') { out.push_back('\\'); }
        out.push_back(c);
      }
      out.append("\",\n");
    }
    out.append("# ]\n");
  }

  out.append(kBlockEnd);
  out.push_back('\n');
  return out;
}

std::vector<std::string> script_meta_requires(std::string_view source) {
  auto const lines{ util_split_lines(source) };
  std::optional<header_span> const span{ find_header(lines) };

  // Locate the module docstring: the first statement, if it is a string literal.
  std::size_t i{ 0 };
  for (; i < lines.size(); ++i) {
    if (span && i >= span->first && i <= span->last) { continue; }
    auto const trimmed{ util_trim(lines[i]) };
    if (trimmed.empty() || trimmed.starts_with('#')) { continue; }
    break;
  }
  if (i >= lines.size()) { return {}; }

  std::string_view first{ util_trim(lines[i]) };
  if (!first.empty() && (first.front() == 'r' || first.front() == 'R' ||
                         first.front() == 'u' || first.front() == 'U')) {
    first.remove_prefix(1);
  }

  std::string_view delimiter;
  if (first.starts_with("\"\"\"")) {
    delimiter = "\"\"\"";
  } else if (first.starts_with("'''")) {
    delimiter = "'''";
  } else {
    return {};
  }

  std::vector<std::string_view> doc_lines;
  std::string_view current{ first.substr(3) };
  for (;;) {
    auto const close{ current.find(delimiter) };
    if (close != std::string_view::npos) {
      doc_lines.push_back(current.substr(0, close));
      break;
    }
    doc_lines.push_back(current);
    if (++i >= lines.size()) { break; }
    current = lines[i];
  }

  std::vector<std::string> names;
  for (auto const line : doc_lines) {
    auto const trimmed{ util_trim(line) };
    if (trimmed.size() < 9 || util_to_lower(trimmed.substr(0, 9)) != "requires:") {
      continue;
    }
    for (auto &name : util_split_csv(trimmed.substr(9))) {
      if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(std::move(name));
      }
    }
  }
  return names;
}

std::string script_meta_strip_main_guard(std::string_view source) {
  auto const lines{ util_split_lines(source) };
  auto const in_string{ triple_string_state(lines) };

  std::vector<std::string_view> kept;
  kept.reserve(lines.size());

  for (std::size_t i{ 0 }; i < lines.size(); ++i) {
    if (!in_string[i] && is_main_guard(lines[i])) {
      // Drop the guard and its indented (or blank) body.
      while (i + 1 < lines.size()) {
        auto const next{ lines[i + 1] };
        bool const blank{ util_trim(next).empty() };
        bool const indented{ !next.empty() && (next.front() == ' ' || next.front() == '\t') };
        if (!blank && !indented && !in_string[i + 1]) { break; }
        ++i;
      }
      continue;
    }
    kept.push_back(lines[i]);
  }

  return join_lines(kept);
}

std::vector<std::string> script_meta_callables(std::string_view source) {
  auto const lines{ util_split_lines(source) };
  auto const in_string{ triple_string_state(lines) };

  std::vector<std::string> names;
  for (std::size_t i{ 0 }; i < lines.size(); ++i) {
    if (in_string[i]) { continue; }

    std::string_view line{ lines[i] };
    if (line.starts_with("async ")) {
      line.remove_prefix(6);
      while (line.starts_with(' ')) { line.remove_prefix(1); }
      if (!line.starts_with("def ")) { continue; }
    }

    std::string_view rest;
    if (line.starts_with("def ")) {
      rest = line.substr(4);
    } else if (line.starts_with("class ")) {
      rest = line.substr(6);
    } else {
      continue;
    }

    while (rest.starts_with(' ')) { rest.remove_prefix(1); }
    if (auto const name{ identifier_at(rest) }; !name.empty()) {
      names.emplace_back(name);
    }
  }
  return names;
}

}  // namespace skillet
