#pragma once

#include "config.h"
#include "util.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillet {

using process_env_t = std::map<std::string, std::string>;

struct captured_stream {
  std::string text;         // at most the configured limit
  std::size_t dropped{ 0 };  // bytes discarded past the limit

  bool truncated() const { return dropped > 0; }
};

struct process_spec {
  std::vector<std::string> argv;  // argv[0] is resolved against PATH from `env`
  process_env_t env;
  std::filesystem::path cwd;
  std::chrono::milliseconds timeout;
  std::size_t output_limit;
  std::optional<std::int64_t> memory_limit_mb;
  std::optional<std::int64_t> cpu_limit_s;
};

struct process_result {
  bool timed_out;
  std::optional<int> exit_code;  // 128 + signal for signalled children; none on timeout
  captured_stream out;
  captured_stream err;
  std::int64_t duration_ms;
};

// Spawn one process as a new process-group leader (stdin /dev/null, core dumps off) and
// capture its output. On timeout the whole group receives SIGKILL. `phase` labels logs
// and trace events.
process_result run_process(process_spec const &spec, std::string_view phase);

enum class run_status { pending, running, succeeded, failed, timed_out };

std::string_view run_status_name(run_status status);

struct run_request {
  std::string artifact;               // composed script text
  std::vector<std::string> packages;  // merged requirement specifiers
  std::string python;                 // merged runtime specifier
  process_env_t env;                  // materialized environment
  std::chrono::seconds timeout;       // effective execution timeout
};

struct run_outcome {
  run_status status;
  std::optional<int> exit_code;
  captured_stream out;
  captured_stream err;
  std::int64_t duration_ms;
};

// Expand {python} {venv} {script} {scratch} in each argument; an argument that is exactly
// {packages} expands to one argument per package.
std::vector<std::string> runner_expand_template(std::vector<std::string> const &tmpl,
                                                std::map<std::string, std::string> const &vars,
                                                std::vector<std::string> const &packages);

// One execution of a composed artifact inside a private scratch directory that is removed
// when the run finishes. Provision and install failures throw dependency_install_error
// with unsanitized output; callers sanitize before it leaves the process.
class sandbox_run : unmovable {
 public:
  explicit sandbox_run(execution_cfg const &cfg);

  run_status status() const { return status_; }

  // Valid once, from pending.
  run_outcome execute(run_request const &request);

 private:
  void transition(run_status next);

  execution_cfg const &cfg_;
  run_status status_{ run_status::pending };
};

}  // namespace skillet
