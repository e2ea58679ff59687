#include "secret.h"

#include <algorithm>
#include <cctype>

namespace skillet {

namespace {

bool chars_equal(char a, char b) {
  return std::tolower(static_cast<unsigned char>(a)) ==
         std::tolower(static_cast<unsigned char>(b));
}

}  // namespace

std::vector<std::string> secret_default_patterns() {
  return { "SECRET_*",   "*_SECRET",     "*_KEY",   "*_PASSWORD",  "*_TOKEN",  "*_API_KEY",
           "*_PRIVATE_KEY", "API_KEY*", "PRIVATE_KEY*", "PASSWORD*", "TOKEN*" };
}

bool secret_glob_match(std::string_view pattern, std::string_view name) {
  std::size_t p{ 0 };
  std::size_t n{ 0 };
  std::size_t star{ std::string_view::npos };
  std::size_t resume{ 0 };

  while (n < name.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || chars_equal(pattern[p], name[n]))) {
      ++p;
      ++n;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = n;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      n = ++resume;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*') { ++p; }
  return p == pattern.size();
}

secret_classifier::secret_classifier(std::vector<std::string> patterns)
    : patterns_{ std::move(patterns) } {}

bool secret_classifier::is_sensitive(std::string_view name) const {
  for (auto const &pattern : patterns_) {
    std::string_view rule{ pattern };
    bool const negated{ !rule.empty() && rule.front() == '!' };
    if (negated) { rule.remove_prefix(1); }
    if (secret_glob_match(rule, name)) { return !negated; }
  }
  return false;
}

std::vector<masked_variable> secret_mask_collection(variable_collection const &collection,
                                                    secret_classifier const &classifier) {
  std::vector<masked_variable> result;
  result.reserve(collection.variables.size());
  for (auto const &[name, value] : collection.variables) {
    bool const sensitive{ classifier.is_sensitive(name) };
    result.push_back(masked_variable{ .name = name,
                                      .value = sensitive ? std::string{ kSecretMarker } : value,
                                      .sensitive = sensitive });
  }
  return result;
}

std::vector<std::string> secret_sensitive_values(variable_list const &variables,
                                                 secret_classifier const &classifier) {
  std::vector<std::string> result;
  for (auto const &[name, value] : variables) {
    if (!value.empty() && classifier.is_sensitive(name)) { result.push_back(value); }
  }
  return result;
}

output_sanitizer::output_sanitizer(std::vector<std::string> values, std::string_view marker)
    : values_{ std::move(values) }, marker_{ marker } {
  std::erase_if(values_, [](std::string const &v) { return v.empty(); });
  std::sort(values_.begin(), values_.end(), [](std::string const &a, std::string const &b) {
    return a.size() != b.size() ? a.size() > b.size() : a < b;
  });
  values_.erase(std::unique(values_.begin(), values_.end()), values_.end());
}

output_sanitizer::result output_sanitizer::sanitize(std::string_view text,
                                                    bool truncated) const {
  result out{ .text = {}, .replacements = 0 };
  if (values_.empty()) {
    out.text = std::string{ text };
    return out;
  }

  out.text.reserve(text.size());
  std::size_t i{ 0 };
  while (i < text.size()) {
    auto const rest{ text.substr(i) };

    auto const full{ std::find_if(values_.begin(), values_.end(), [&](std::string const &v) {
      return rest.starts_with(v);
    }) };
    if (full != values_.end()) {
      out.text.append(marker_);
      ++out.replacements;
      i += full->size();
      continue;
    }

    if (truncated && std::any_of(values_.begin(), values_.end(), [&](std::string const &v) {
          return rest.size() < v.size() && std::string_view{ v }.starts_with(rest);
        })) {
      out.text.append(marker_);
      ++out.replacements;
      break;
    }

    out.text.push_back(text[i]);
    ++i;
  }

  return out;
}

}  // namespace skillet
