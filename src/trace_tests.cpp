#include "trace.h"

#include "doctest.h"

#include <string>

TEST_CASE("trace_event_name matches the event type") {
  CHECK(skillet::trace_event_name(skillet::trace_events::plan_resolved{
            .functions = "fetch,parse", .function_count = 2, .collection_count = 1 }) ==
        "plan_resolved");
  CHECK(skillet::trace_event_name(skillet::trace_events::phase_timed_out{
            .phase = "interpreter", .timeout_s = 1 }) == "phase_timed_out");
}

TEST_CASE("trace_event_to_string renders key=value pairs") {
  CHECK(skillet::trace_event_to_string(skillet::trace_events::phase_exited{
            .phase = "install", .exit_code = 1, .duration_ms = 250 }) ==
        "phase_exited phase=install exit_code=1 duration_ms=250");
  CHECK(skillet::trace_event_to_string(skillet::trace_events::output_redacted{
            .stream = "stdout", .replacements = 3 }) ==
        "output_redacted stream=stdout replacements=3");
}

TEST_CASE("trace_event_to_json emits one object with timestamp and fields") {
  auto const json{ skillet::trace_event_to_json(skillet::trace_events::secret_file_written{
      .collection = "creds", .path = "/s/\"creds\".env", .key_count = 2 }) };

  CHECK(json.starts_with("{\"ts\":\""));
  CHECK(json.ends_with("}"));
  CHECK(json.find("\"event\":\"secret_file_written\"") != std::string::npos);
  CHECK(json.find("\"collection\":\"creds\"") != std::string::npos);
  CHECK(json.find("\"path\":\"/s/\\\"creds\\\".env\"") != std::string::npos);
  CHECK(json.find("\"key_count\":2") != std::string::npos);
}
