#pragma once

#include "graph.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace skillet {

inline constexpr std::string_view kSecretMarker{ "<SECRET>" };      // store reads
inline constexpr std::string_view kRedactedMarker{ "<REDACTED>" };  // process output

std::vector<std::string> secret_default_patterns();

// Case-insensitive glob match; '*' matches any run, '?' any single character.
bool secret_glob_match(std::string_view pattern, std::string_view name);

// Ordered glob rules; the first matching rule decides. A rule prefixed with '!' marks
// matching names as not sensitive.
class secret_classifier {
 public:
  explicit secret_classifier(std::vector<std::string> patterns = secret_default_patterns());

  bool is_sensitive(std::string_view name) const;
  std::vector<std::string> const &patterns() const { return patterns_; }

 private:
  std::vector<std::string> patterns_;
};

struct masked_variable {
  std::string name;
  std::string value;  // kSecretMarker when sensitive
  bool sensitive;
};

std::vector<masked_variable> secret_mask_collection(variable_collection const &collection,
                                                    secret_classifier const &classifier);

// Values of every sensitive variable in `variables` (empty values skipped).
std::vector<std::string> secret_sensitive_values(variable_list const &variables,
                                                 secret_classifier const &classifier);

// Replaces occurrences of known sensitive values with a marker. Longest value wins at
// each position and inserted markers are never rescanned.
class output_sanitizer {
 public:
  explicit output_sanitizer(std::vector<std::string> values,
                            std::string_view marker = kRedactedMarker);

  struct result {
    std::string text;
    std::size_t replacements;
  };

  // When `truncated`, a trailing fragment that begins some sensitive value is also
  // replaced, since the rest of that value was cut off.
  result sanitize(std::string_view text, bool truncated = false) const;

  bool empty() const { return values_.empty(); }

 private:
  std::vector<std::string> values_;  // distinct, non-empty, longest first
  std::string marker_;
};

}  // namespace skillet
