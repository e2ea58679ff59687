#include "invocation.h"

#include "composer.h"
#include "dep_merge.h"
#include "environment.h"
#include "errors.h"
#include "resolver.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace skillet {
namespace {

std::string sanitize_stream(output_sanitizer const &sanitizer,
                            captured_stream const &stream,
                            char const *name) {
  auto [text, replacements]{ sanitizer.sanitize(stream.text, stream.truncated()) };
  if (replacements > 0) {
    tui::debug("Redacted %zu sensitive value(s) from %s", replacements, name);
    SKILLET_TRACE_OUTPUT_REDACTED(std::string{ name }, replacements);
  }

  if (stream.truncated()) {
    if (!text.empty() && text.back() != '\n') { text += '\n'; }
    text += invocation_truncation_marker(stream.dropped);
    text += '\n';
  }
  return text;
}

std::string last_line(std::string_view text) {
  auto const lines{ util_split_lines(util_trim(text)) };
  if (lines.empty()) { return {}; }
  return std::string{ util_trim(lines.back()) };
}

}  // namespace

std::int64_t invocation_effective_timeout(std::optional<std::int64_t> requested,
                                          execution_cfg const &execution) {
  if (requested && *requested < 1) {
    throw std::invalid_argument("timeout must be at least 1 second, got " +
                                std::to_string(*requested));
  }
  return std::min(requested.value_or(execution.default_timeout), execution.max_timeout);
}

std::string invocation_truncation_marker(std::size_t dropped) {
  return "[skillet: output truncated, " + std::to_string(dropped) + " bytes omitted]";
}

invocation_response invoke(invocation_ctx const &ctx, invocation_request const &request) {
  auto const timeout{ invocation_effective_timeout(request.timeout, ctx.execution) };

  auto const plan{ resolve(ctx.graph, request.imports) };
  auto const deps{ merge_dependencies(plan.functions, ctx.execution.default_python) };
  auto const artifact{ compose(plan, deps, request.code) };
  auto const env{
    materialize_environment(plan, ctx.classifier, ctx.store, ctx.execution.inherit_env)
  };
  output_sanitizer const sanitizer{ env.sensitive_values };

  tui::debug("Invoking %zu function(s), timeout %llds",
             plan.functions.size(),
             static_cast<long long>(timeout));

  sandbox_run run{ ctx.execution };
  run_outcome outcome;
  try {
    outcome = run.execute(run_request{ .artifact = artifact.text,
                                       .packages = deps.package_specs(),
                                       .python = deps.python_spec(),
                                       .env = env.variables,
                                       .timeout = std::chrono::seconds{ timeout } });
  } catch (dependency_install_error const &e) {
    throw dependency_install_error{ sanitizer.sanitize(e.what()).text,
                                    sanitizer.sanitize(e.stdout_text).text,
                                    sanitizer.sanitize(e.stderr_text).text };
  }

  return invocation_response{ .status = outcome.status,
                              .exit_code = outcome.exit_code,
                              .stdout_text = sanitize_stream(sanitizer, outcome.out, "stdout"),
                              .stderr_text = sanitize_stream(sanitizer, outcome.err, "stderr"),
                              .duration_ms = outcome.duration_ms,
                              .functions = plan.function_names(),
                              .timeout = timeout };
}

void invocation_response::throw_if_unsuccessful() const {
  switch (status) {
    case run_status::succeeded: return;
    case run_status::timed_out:
      throw execution_timeout_error{ "Execution timed out after " + std::to_string(timeout) +
                                     "s" };
    default: {
      std::string what{ "Execution failed" };
      if (exit_code) { what += " with exit code " + std::to_string(*exit_code); }
      if (auto const detail{ last_line(stderr_text) }; !detail.empty()) {
        what += ": " + detail;
      }
      throw execution_failed_error{ what, exit_code };
    }
  }
}

std::string invocation_response::to_json() const {
  std::string out{ "{\"status\":\"" };
  out += run_status_name(status);
  out += "\",\"exit_code\":";
  out += exit_code ? std::to_string(*exit_code) : "null";
  out += ",\"stdout\":\"";
  util_append_json_string(out, stdout_text);
  out += "\",\"stderr\":\"";
  util_append_json_string(out, stderr_text);
  out += "\",\"duration_ms\":" + std::to_string(duration_ms);
  out += ",\"functions\":[";
  for (std::size_t i{ 0 }; i < functions.size(); ++i) {
    if (i) { out += ','; }
    out += '"';
    util_append_json_string(out, functions[i]);
    out += '"';
  }
  out += "],\"timeout\":" + std::to_string(timeout) + "}";
  return out;
}

}  // namespace skillet
