#include "requirement.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace skillet {

namespace {

bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

std::vector<unsigned> parse_components(std::string_view text) {
  std::vector<unsigned> components;
  std::size_t pos{ 0 };
  for (;;) {
    auto const dot{ text.find('.', pos) };
    auto const piece{ text.substr(pos, dot == std::string_view::npos ? dot : dot - pos) };

    unsigned value{ 0 };
    auto const [end, ec]{ std::from_chars(piece.data(), piece.data() + piece.size(), value) };
    if (piece.empty() || ec != std::errc{} || end != piece.data() + piece.size()) {
      throw std::invalid_argument("invalid version '" + std::string{ text } + "'");
    }
    components.push_back(value);

    if (dot == std::string_view::npos) { break; }
    pos = dot + 1;
  }

  if (components.size() > 3) {
    throw std::invalid_argument("unsupported version '" + std::string{ text } +
                                "' (more than three components)");
  }
  return components;
}

release_version make_version(std::vector<unsigned> components, std::string text) {
  components.resize(3, 0);
  std::string const padded{ std::to_string(components[0]) + "." +
                            std::to_string(components[1]) + "." +
                            std::to_string(components[2]) };

  release_version result{ .text = std::move(text), .value = {} };
  if (!semver::parse(padded, result.value)) {
    throw std::invalid_argument("invalid version '" + result.text + "'");
  }
  return result;
}

// Upper bound obtained by bumping component `index` and dropping the rest.
release_version bump(std::vector<unsigned> components, std::size_t index) {
  components.resize(index + 1);
  ++components[index];

  std::string text;
  for (auto const c : components) {
    if (!text.empty()) { text.push_back('.'); }
    text += std::to_string(c);
  }
  return make_version(std::move(components), std::move(text));
}

// Stricter of two lower (or upper) bounds.
version_bound tighter(version_bound const &a, version_bound const &b, bool lower) {
  int const cmp{ release_version_compare(a.version, b.version) };
  if (cmp == 0) { return a.inclusive ? b : a; }
  return (cmp > 0) == lower ? a : b;
}

bool excluded(version_range const &range, release_version const &v) {
  return std::any_of(range.exclusions.begin(),
                     range.exclusions.end(),
                     [&](release_version const &x) { return release_version_compare(x, v) == 0; });
}

bool within_bounds(version_range const &range, release_version const &v) {
  if (range.lower) {
    int const cmp{ release_version_compare(v, range.lower->version) };
    if (cmp < 0 || (cmp == 0 && !range.lower->inclusive)) { return false; }
  }
  if (range.upper) {
    int const cmp{ release_version_compare(v, range.upper->version) };
    if (cmp > 0 || (cmp == 0 && !range.upper->inclusive)) { return false; }
  }
  return true;
}

void apply_clause(version_range &range, std::string_view clause) {
  static constexpr std::string_view kOps[]{ "===", "~=", "==", "!=", "<=", ">=", "<", ">" };

  auto const op{ std::find_if(std::begin(kOps), std::end(kOps), [&](std::string_view o) {
    return clause.starts_with(o);
  }) };
  if (op == std::end(kOps)) {
    throw std::invalid_argument("invalid specifier clause '" + std::string{ clause } + "'");
  }

  auto const version_text{ util_trim(clause.substr(op->size())) };
  if (version_text.empty()) {
    throw std::invalid_argument("missing version in '" + std::string{ clause } + "'");
  }

  version_range bound;
  if (*op == "===") {
    throw std::invalid_argument("arbitrary equality is not supported: '" +
                                std::string{ clause } + "'");
  } else if (*op == "==" && version_text.ends_with(".*")) {
    auto const prefix{ version_text.substr(0, version_text.size() - 2) };
    auto const components{ parse_components(prefix) };
    bound.lower = version_bound{ .version = make_version(components, std::string{ prefix }),
                                 .inclusive = true };
    bound.upper = version_bound{ .version = bump(components, components.size() - 1),
                                 .inclusive = false };
  } else if (*op == "~=") {
    auto const components{ parse_components(version_text) };
    if (components.size() < 2) {
      throw std::invalid_argument("'~=' needs at least two version components: '" +
                                  std::string{ clause } + "'");
    }
    bound.lower = version_bound{
      .version = make_version(components, std::string{ version_text }),
      .inclusive = true
    };
    bound.upper = version_bound{ .version = bump(components, components.size() - 2),
                                 .inclusive = false };
  } else {
    auto const v{ release_version_parse(version_text) };
    if (*op == "==") {
      bound.lower = version_bound{ .version = v, .inclusive = true };
      bound.upper = version_bound{ .version = v, .inclusive = true };
    } else if (*op == "!=") {
      bound.exclusions.push_back(v);
    } else if (*op == ">=" || *op == ">") {
      bound.lower = version_bound{ .version = v, .inclusive = *op == ">=" };
    } else {
      bound.upper = version_bound{ .version = v, .inclusive = *op == "<=" };
    }
  }

  range = range.intersect(bound);
}

std::string collapse_whitespace(std::string_view text) {
  std::string result;
  bool pending_space{ false };
  for (char const c : util_trim(text)) {
    if (c == ' ' || c == '\t') {
      pending_space = true;
      continue;
    }
    if (pending_space) { result.push_back(' '); }
    pending_space = false;
    result.push_back(c);
  }
  return result;
}

}  // namespace

release_version release_version_parse(std::string_view text) {
  auto const trimmed{ util_trim(text) };
  return make_version(parse_components(trimmed), std::string{ trimmed });
}

int release_version_compare(release_version const &a, release_version const &b) {
  if (a.value < b.value) { return -1; }
  if (b.value < a.value) { return 1; }
  return 0;
}

bool version_range::empty() const {
  if (lower && upper) {
    int const cmp{ release_version_compare(lower->version, upper->version) };
    if (cmp > 0) { return true; }
    if (cmp == 0) {
      return !lower->inclusive || !upper->inclusive || excluded(*this, lower->version);
    }
  }
  return false;
}

version_range version_range::intersect(version_range const &other) const {
  version_range result{ *this };

  if (other.lower) {
    result.lower = result.lower ? tighter(*result.lower, *other.lower, true) : other.lower;
  }
  if (other.upper) {
    result.upper = result.upper ? tighter(*result.upper, *other.upper, false) : other.upper;
  }
  for (auto const &x : other.exclusions) {
    if (!excluded(result, x)) { result.exclusions.push_back(x); }
  }
  return result;
}

std::string version_range::render() const {
  if (lower && upper && lower->inclusive && upper->inclusive &&
      release_version_compare(lower->version, upper->version) == 0) {
    return "==" + lower->version.text;
  }

  std::vector<std::string> clauses;
  if (lower) { clauses.push_back((lower->inclusive ? ">=" : ">") + lower->version.text); }
  if (upper) { clauses.push_back((upper->inclusive ? "<=" : "<") + upper->version.text); }
  for (auto const &x : exclusions) {
    if (within_bounds(*this, x)) { clauses.push_back("!=" + x.text); }
  }

  std::string result;
  for (auto const &clause : clauses) {
    if (!result.empty()) { result.push_back(','); }
    result += clause;
  }
  return result;
}

version_range version_range_parse(std::string_view specifier) {
  version_range range;
  auto const trimmed{ util_trim(specifier) };
  if (trimmed.empty()) { return range; }

  std::size_t pos{ 0 };
  for (;;) {
    auto const comma{ trimmed.find(',', pos) };
    auto const clause{ util_trim(
        trimmed.substr(pos, comma == std::string_view::npos ? comma : comma - pos)) };
    if (clause.empty()) {
      throw std::invalid_argument("empty clause in specifier '" + std::string{ trimmed } +
                                  "'");
    }
    apply_clause(range, clause);

    if (comma == std::string_view::npos) { break; }
    pos = comma + 1;
  }
  return range;
}

std::string requirement_normalize_name(std::string_view name) {
  std::string result;
  result.reserve(name.size());
  for (char const c : name) {
    if (c == '-' || c == '_' || c == '.') {
      if (result.empty() || result.back() != '-') { result.push_back('-'); }
    } else {
      result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return result;
}

std::string requirement::render() const {
  std::string result{ name };
  if (!extras.empty()) {
    result.push_back('[');
    bool first{ true };
    for (auto const &extra : extras) {
      if (!first) { result.push_back(','); }
      first = false;
      result += extra;
    }
    result.push_back(']');
  }
  result += range.render();
  if (!marker.empty()) { result += "; " + marker; }
  return result;
}

requirement requirement_parse(std::string_view text) {
  std::string_view rest{ util_trim(text) };
  std::string_view marker;
  if (auto const semi{ rest.find(';') }; semi != std::string_view::npos) {
    marker = util_trim(rest.substr(semi + 1));
    rest = util_trim(rest.substr(0, semi));
    if (marker.empty()) {
      throw std::invalid_argument("empty environment marker in '" + std::string{ text } +
                                  "'");
    }
  }

  std::size_t pos{ 0 };
  while (pos < rest.size() && is_name_char(rest[pos])) { ++pos; }
  auto const raw_name{ rest.substr(0, pos) };
  if (raw_name.empty() || !std::isalnum(static_cast<unsigned char>(raw_name.front())) ||
      !std::isalnum(static_cast<unsigned char>(raw_name.back()))) {
    throw std::invalid_argument("invalid package name in '" + std::string{ text } + "'");
  }

  requirement result{ .name = requirement_normalize_name(raw_name),
                      .extras = {},
                      .range = {},
                      .marker = collapse_whitespace(marker) };

  rest = util_trim(rest.substr(pos));
  if (rest.starts_with('[')) {
    auto const close{ rest.find(']') };
    if (close == std::string_view::npos) {
      throw std::invalid_argument("unterminated extras in '" + std::string{ text } + "'");
    }
    for (auto const &extra : util_split_csv(rest.substr(1, close - 1))) {
      if (!std::all_of(extra.begin(), extra.end(), is_name_char)) {
        throw std::invalid_argument("invalid extra '" + extra + "' in '" +
                                    std::string{ text } + "'");
      }
      result.extras.insert(requirement_normalize_name(extra));
    }
    rest = util_trim(rest.substr(close + 1));
  }

  if (rest.starts_with('@')) {
    throw std::invalid_argument("URL requirements are not supported: '" +
                                std::string{ text } + "'");
  }

  if (rest.starts_with('(')) {
    if (!rest.ends_with(')')) {
      throw std::invalid_argument("unbalanced parenthesis in '" + std::string{ text } + "'");
    }
    rest = util_trim(rest.substr(1, rest.size() - 2));
  }

  result.range = version_range_parse(rest);
  return result;
}

}  // namespace skillet
