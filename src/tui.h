#pragma once

#include "trace.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(__clang__) || defined(__GNUC__)
#define SKILLET_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define SKILLET_TUI_PRINTF(idx, first)
#endif

namespace skillet::tui {

enum class level { TUI_TRACE, TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

// "trace", "debug", "info", "warn", "error" (case-insensitive)
std::optional<level> parse_level(std::string_view name);

enum class trace_output_type { std_err, file };

struct trace_output_spec {
  trace_output_type type;
  std::optional<std::filesystem::path> file_path;
};

void init();
void configure_trace_outputs(std::vector<trace_output_spec> outputs);
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

// Adjust the threshold of a running logger (config may lower it after startup).
void set_threshold(std::optional<level> threshold);

extern bool g_trace_enabled;

void trace(trace_event_t event);
void debug(char const *fmt, ...) SKILLET_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) SKILLET_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) SKILLET_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) SKILLET_TUI_PRINTF(1, 2);

// Unbuffered write of already-sanitized process output.
void write_stdout(std::string_view text);
void write_stderr(std::string_view text);
void print_stdout(char const *fmt, ...) SKILLET_TUI_PRINTF(1, 2);

bool is_tty();

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace skillet::tui

#undef SKILLET_TUI_PRINTF
