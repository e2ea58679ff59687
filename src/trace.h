#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace skillet {

namespace trace_events {

struct plan_resolved {
  std::string functions;  // comma-joined names in plan order
  std::int64_t function_count;
  std::int64_t collection_count;
};

struct deps_merged {
  std::int64_t package_count;
  std::string python;
};

struct artifact_composed {
  std::int64_t unit_count;
  std::int64_t bytes;
};

struct phase_spawned {
  std::string phase;
  std::string program;
  std::int64_t pid;
};

struct phase_exited {
  std::string phase;
  int exit_code;
  std::int64_t duration_ms;
};

struct phase_timed_out {
  std::string phase;
  std::int64_t timeout_s;
};

struct output_redacted {
  std::string stream;
  std::int64_t replacements;
};

struct secret_file_written {
  std::string collection;
  std::string path;
  std::int64_t key_count;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::plan_resolved,
                                   trace_events::deps_merged,
                                   trace_events::artifact_composed,
                                   trace_events::phase_spawned,
                                   trace_events::phase_exited,
                                   trace_events::phase_timed_out,
                                   trace_events::output_redacted,
                                   trace_events::secret_file_written>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace skillet

#define SKILLET_TRACE_UNLIKELY [[unlikely]]

#define SKILLET_TRACE_EMIT(event_expr) \
  do { \
    if (::skillet::tui::g_trace_enabled) SKILLET_TRACE_UNLIKELY { \
        ::skillet::tui::trace event_expr; \
      } \
  } while (0)

#define SKILLET_TRACE_PLAN_RESOLVED(functions_value, function_count_value, collection_count_value) \
  SKILLET_TRACE_EMIT((::skillet::trace_events::plan_resolved{ \
      .functions = (functions_value), \
      .function_count = static_cast<std::int64_t>(function_count_value), \
      .collection_count = static_cast<std::int64_t>(collection_count_value), \
  }))

#define SKILLET_TRACE_DEPS_MERGED(package_count_value, python_value) \
  SKILLET_TRACE_EMIT((::skillet::trace_events::deps_merged{ \
      .package_count = static_cast<std::int64_t>(package_count_value), \
      .python = (python_value), \
  }))

#define SKILLET_TRACE_ARTIFACT_COMPOSED(unit_count_value, bytes_value) \
  SKILLET_TRACE_EMIT((::skillet::trace_events::artifact_composed{ \
      .unit_count = static_cast<std::int64_t>(unit_count_value), \
      .bytes = static_cast<std::int64_t>(bytes_value), \
  }))

#define SKILLET_TRACE_PHASE_SPAWNED(phase_value, program_value, pid_value) \
  SKILLET_TRACE_EMIT((::skillet::trace_events::phase_spawned{ \
      .phase = (phase_value), \
      .program = (program_value), \
      .pid = static_cast<std::int64_t>(pid_value), \
  }))

#define SKILLET_TRACE_PHASE_EXITED(phase_value, exit_code_value, duration_value) \
  SKILLET_TRACE_EMIT((::skillet::trace_events::phase_exited{ \
      .phase = (phase_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define SKILLET_TRACE_PHASE_TIMED_OUT(phase_value, timeout_value) \
  SKILLET_TRACE_EMIT((::skillet::trace_events::phase_timed_out{ \
      .phase = (phase_value), \
      .timeout_s = static_cast<std::int64_t>(timeout_value), \
  }))

#define SKILLET_TRACE_OUTPUT_REDACTED(stream_value, replacements_value) \
  SKILLET_TRACE_EMIT((::skillet::trace_events::output_redacted{ \
      .stream = (stream_value), \
      .replacements = static_cast<std::int64_t>(replacements_value), \
  }))

#define SKILLET_TRACE_SECRET_FILE_WRITTEN(collection_value, path_value, key_count_value) \
  SKILLET_TRACE_EMIT((::skillet::trace_events::secret_file_written{ \
      .collection = (collection_value), \
      .path = (path_value), \
      .key_count = static_cast<std::int64_t>(key_count_value), \
  }))
