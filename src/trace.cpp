#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace skillet {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm utc_tm{};
  gmtime_r(&timestamp, &utc_tm);

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  util_append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(plan_resolved),
                        TRACE_NAME(deps_merged),
                        TRACE_NAME(artifact_composed),
                        TRACE_NAME(phase_spawned),
                        TRACE_NAME(phase_exited),
                        TRACE_NAME(phase_timed_out),
                        TRACE_NAME(output_redacted),
                        TRACE_NAME(secret_file_written),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::plan_resolved const &value) {
            std::ostringstream oss;
            oss << "plan_resolved functions=[" << value.functions
                << "] function_count=" << value.function_count
                << " collection_count=" << value.collection_count;
            return oss.str();
          },
          [](trace_events::deps_merged const &value) {
            std::ostringstream oss;
            oss << "deps_merged package_count=" << value.package_count
                << " python=" << value.python;
            return oss.str();
          },
          [](trace_events::artifact_composed const &value) {
            std::ostringstream oss;
            oss << "artifact_composed unit_count=" << value.unit_count
                << " bytes=" << value.bytes;
            return oss.str();
          },
          [](trace_events::phase_spawned const &value) {
            std::ostringstream oss;
            oss << "phase_spawned phase=" << value.phase << " program=" << value.program
                << " pid=" << value.pid;
            return oss.str();
          },
          [](trace_events::phase_exited const &value) {
            std::ostringstream oss;
            oss << "phase_exited phase=" << value.phase << " exit_code=" << value.exit_code
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::phase_timed_out const &value) {
            std::ostringstream oss;
            oss << "phase_timed_out phase=" << value.phase
                << " timeout_s=" << value.timeout_s;
            return oss.str();
          },
          [](trace_events::output_redacted const &value) {
            std::ostringstream oss;
            oss << "output_redacted stream=" << value.stream
                << " replacements=" << value.replacements;
            return oss.str();
          },
          [](trace_events::secret_file_written const &value) {
            std::ostringstream oss;
            oss << "secret_file_written collection=" << value.collection
                << " path=" << value.path << " key_count=" << value.key_count;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(192);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(match{
                 [&](trace_events::plan_resolved const &value) {
                   append_kv(output, "functions", value.functions);
                   append_kv(output, "function_count", value.function_count);
                   append_kv(output, "collection_count", value.collection_count);
                 },
                 [&](trace_events::deps_merged const &value) {
                   append_kv(output, "package_count", value.package_count);
                   append_kv(output, "python", value.python);
                 },
                 [&](trace_events::artifact_composed const &value) {
                   append_kv(output, "unit_count", value.unit_count);
                   append_kv(output, "bytes", value.bytes);
                 },
                 [&](trace_events::phase_spawned const &value) {
                   append_kv(output, "phase", value.phase);
                   append_kv(output, "program", value.program);
                   append_kv(output, "pid", value.pid);
                 },
                 [&](trace_events::phase_exited const &value) {
                   append_kv(output, "phase", value.phase);
                   append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
                   append_kv(output, "duration_ms", value.duration_ms);
                 },
                 [&](trace_events::phase_timed_out const &value) {
                   append_kv(output, "phase", value.phase);
                   append_kv(output, "timeout_s", value.timeout_s);
                 },
                 [&](trace_events::output_redacted const &value) {
                   append_kv(output, "stream", value.stream);
                   append_kv(output, "replacements", value.replacements);
                 },
                 [&](trace_events::secret_file_written const &value) {
                   append_kv(output, "collection", value.collection);
                   append_kv(output, "path", value.path);
                   append_kv(output, "key_count", value.key_count);
                 },
             },
             event);

  output.push_back('}');
  return output;
}

}  // namespace skillet
