#pragma once

#include "trace.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(__clang__) || defined(__GNUC__)
#define REFPACK_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define REFPACK_TUI_PRINTF(idx, first)
#endif

// Diagnostics for refpack. Log lines and trace events are queued by the calling
// thread and written by a background writer between run() and shutdown().
// Nothing is written outside that window.
namespace refpack::tui {

enum class level { TUI_TRACE, TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

enum class trace_output_type { std_err, file };

struct trace_output_spec {
  trace_output_type type;
  std::optional<std::filesystem::path> file_path;
};

void init();

// Trace events go to the log stream as text, to a JSONL file, or both. At most
// one file. Only valid while stopped.
void configure_trace_outputs(std::vector<trace_output_spec> outputs);

// Replaces stderr as the destination of log lines. Only valid while stopped.
void set_output_handler(std::function<void(std::string_view)> handler);

void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

extern bool g_trace_enabled;

// "WRN", "INF", ...
std::string_view level_tag(level value);

// One output line: "<message>\n", or "HH:MM:SS.mmm TAG <message>\n" when decorated.
std::string format_line(level severity, std::string_view message, bool decorated);

void trace(trace_event_t event);
void debug(char const *fmt, ...) REFPACK_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) REFPACK_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) REFPACK_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) REFPACK_TUI_PRINTF(1, 2);

// Command results; bypasses the queue and the threshold.
void print_stdout(char const *fmt, ...) REFPACK_TUI_PRINTF(1, 2);

// run() on construction and shutdown() on destruction, if init() was called.
struct scope {
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace refpack::tui

#undef REFPACK_TUI_PRINTF
