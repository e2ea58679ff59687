#pragma once

#include "config.h"
#include "graph.h"
#include "runner.h"
#include "secret.h"
#include "secret_store.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skillet {

struct invocation_request {
  std::string code;                     // invocation code appended after the function bodies
  std::vector<std::string> imports;     // function unit names
  std::optional<std::int64_t> timeout;  // seconds; configured default when unset
};

struct invocation_response {
  run_status status;
  std::optional<int> exit_code;
  std::string stdout_text;  // sanitized
  std::string stderr_text;  // sanitized
  std::int64_t duration_ms;
  std::vector<std::string> functions;  // included units, plan order
  std::int64_t timeout;                // effective, seconds

  bool succeeded() const { return status == run_status::succeeded; }

  // Throws execution_timeout_error or execution_failed_error unless succeeded.
  void throw_if_unsuccessful() const;

  std::string to_json() const;
};

// Everything an invocation reads; shared read-only across concurrent invocations.
struct invocation_ctx {
  graph_reader const &graph;
  execution_cfg const &execution;
  secret_classifier const &classifier;
  secret_store const *store;  // may be null
};

// min(requested or default, max). Throws std::invalid_argument for a request below 1.
std::int64_t invocation_effective_timeout(std::optional<std::int64_t> requested,
                                          execution_cfg const &execution);

// Text appended to a stream that exceeded the capture limit.
std::string invocation_truncation_marker(std::size_t dropped);

// Resolve, merge, compose, materialize, run and sanitize one request. Resolution, merge
// and compose errors propagate before anything is spawned; dependency_install_error is
// rethrown with sanitized output.
invocation_response invoke(invocation_ctx const &ctx, invocation_request const &request);

}  // namespace skillet
