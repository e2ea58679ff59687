#pragma once

#include "semver.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace skillet {

// Numeric release version, padded to three components for ordering ("2.31" orders as
// 2.31.0). `text` keeps the spelling used in the declaration.
struct release_version {
  std::string text;
  semver::version<> value;
};

// Throws std::invalid_argument on pre-release, local or non-numeric versions and on
// more than three components.
release_version release_version_parse(std::string_view text);

int release_version_compare(release_version const &a, release_version const &b);

struct version_bound {
  release_version version;
  bool inclusive;
};

// Interval of versions with point exclusions. No bounds means any version.
struct version_range {
  std::optional<version_bound> lower;
  std::optional<version_bound> upper;
  std::vector<release_version> exclusions;

  bool empty() const;
  bool unbounded() const { return !lower && !upper && exclusions.empty(); }
  version_range intersect(version_range const &other) const;

  // Canonical specifier: "==1.2", or comma-joined ">=", "<", "!=" clauses; "" if any.
  std::string render() const;
};

// Comma-separated clauses: ">=3.12", ">=1,<2,!=1.5", "~=2.2", "==3.*".
version_range version_range_parse(std::string_view specifier);

// PEP 503 normalization: lower case, runs of '-', '_' and '.' become one '-'.
std::string requirement_normalize_name(std::string_view name);

struct requirement {
  std::string name;  // normalized
  std::set<std::string> extras;
  version_range range;
  std::string marker;  // environment marker, whitespace-collapsed; empty when absent

  // "name[extra,...]<spec>; marker"
  std::string render() const;
};

// PEP 508 subset: name, optional extras, optional (possibly parenthesized) specifier,
// optional "; marker". URL requirements are not supported. Throws std::invalid_argument.
requirement requirement_parse(std::string_view text);

}  // namespace skillet
