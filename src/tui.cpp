#include "tui.h"

#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace refpack::tui {

bool g_trace_enabled{ false };

}  // namespace refpack::tui

namespace {

using refpack::tui::level;
using clock_type = std::chrono::system_clock;

constexpr std::chrono::milliseconds kWriterWakeInterval{ 25 };

struct log_line {
  level severity;
  clock_type::time_point at;
  std::string text;
};

using queued_item = std::variant<log_line, refpack::trace_event_t>;

std::string render(level severity,
                   std::string_view message,
                   bool decorated,
                   clock_type::time_point at) {
  std::string out;
  if (decorated) {
    std::time_t const secs{ clock_type::to_time_t(at) };
    std::tm local{};
    localtime_r(&secs, &local);
    auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                       at.time_since_epoch())
                       .count() %
                   1000 };
    char stamp[32]{};
    std::snprintf(stamp,
                  sizeof stamp,
                  "%02d:%02d:%02d.%03d ",
                  local.tm_hour,
                  local.tm_min,
                  local.tm_sec,
                  static_cast<int>(ms));
    out.append(stamp);
    out.append(refpack::tui::level_tag(severity));
    out.push_back(' ');
  }
  out.append(message);
  out.push_back('\n');
  return out;
}

std::string vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const needed{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (needed <= 0) { return {}; }

  std::string text(static_cast<std::size_t>(needed) + 1, '\0');
  std::vsnprintf(text.data(), text.size(), fmt, args);
  text.resize(static_cast<std::size_t>(needed));
  return text;
}

// Owns the queue, the destinations and the background writer thread.
class log_writer {
 public:
  bool initialized{ false };

  bool running() const { return thread_.joinable(); }

  void set_handler(std::function<void(std::string_view)> handler) {
    std::lock_guard<std::mutex> lock{ mutex_ };
    handler_ = std::move(handler);
  }

  void set_trace_outputs(bool to_log, std::FILE *file) {
    close_trace_file();
    trace_to_log_ = to_log;
    trace_file_ = file;
  }

  bool tracing() const { return trace_to_log_ || trace_file_; }

  void start(std::optional<level> threshold, bool decorated) {
    threshold_ = threshold;
    decorated_ = decorated;
    stopping_ = false;
    thread_ = std::thread{ [this] { loop(); } };
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock{ mutex_ };
      stopping_ = true;
    }
    wake_.notify_all();
    thread_.join();
    close_trace_file();
    trace_to_log_ = false;
  }

  bool accepts(level severity) const { return !threshold_ || severity >= *threshold_; }

  void push(queued_item item) {
    {
      std::lock_guard<std::mutex> lock{ mutex_ };
      queue_.push_back(std::move(item));
    }
    wake_.notify_one();
  }

  void print(char const *fmt, va_list args) {
    std::lock_guard<std::mutex> lock{ stdout_mutex_ };
    if (std::vprintf(fmt, args) > 0) { std::fflush(stdout); }
  }

 private:
  void loop() {
    std::unique_lock<std::mutex> lock{ mutex_ };
    for (;;) {
      wake_.wait_for(lock, kWriterWakeInterval, [this] { return stopping_ || !queue_.empty(); });
      std::deque<queued_item> batch;
      batch.swap(queue_);
      bool const last{ stopping_ };
      auto const handler{ handler_ };

      lock.unlock();
      write(batch, handler);
      lock.lock();

      if (last && queue_.empty()) { return; }
    }
  }

  void write(std::deque<queued_item> &batch,
             std::function<void(std::string_view)> const &handler) {
    bool stderr_dirty{ false };
    auto const emit{ [&](std::string const &text) {
      if (handler) {
        handler(text);
      } else {
        std::fwrite(text.data(), 1, text.size(), stderr);
        stderr_dirty = true;
      }
    } };

    for (auto &item : batch) {
      if (auto const *line{ std::get_if<log_line>(&item) }) {
        emit(render(line->severity, line->text, decorated_, line->at));
        continue;
      }

      auto const &event{ std::get<refpack::trace_event_t>(item) };
      if (trace_to_log_) {
        emit(render(level::TUI_TRACE,
                    "trace " + refpack::trace_event_to_string(event),
                    decorated_,
                    clock_type::now()));
      }
      if (trace_file_) { append_trace_json(event); }
    }

    if (stderr_dirty) { std::fflush(stderr); }
  }

  // A failing trace file is reported once and closed; logging continues.
  void append_trace_json(refpack::trace_event_t const &event) {
    auto const json{ refpack::trace_event_to_json(event) + "\n" };
    if (std::fwrite(json.data(), 1, json.size(), trace_file_) == json.size() &&
        std::fflush(trace_file_) == 0) {
      return;
    }
    std::fputs("refpack: trace file write failed; trace file disabled\n", stderr);
    std::fflush(stderr);
    close_trace_file();
  }

  void close_trace_file() {
    if (trace_file_) {
      std::fclose(trace_file_);
      trace_file_ = nullptr;
    }
  }

  std::mutex mutex_;  // guards queue_, handler_ and stopping_
  std::condition_variable wake_;
  std::deque<queued_item> queue_;
  std::function<void(std::string_view)> handler_;
  bool stopping_{ false };
  std::thread thread_;

  std::mutex stdout_mutex_;
  std::optional<level> threshold_;
  bool decorated_{ false };
  bool trace_to_log_{ false };
  std::FILE *trace_file_{ nullptr };
};

log_writer s_writer;

void require_idle(char const *what) {
  if (!s_writer.initialized) {
    throw std::logic_error{ std::string{ "refpack::tui::" } + what + " called before init" };
  }
  if (s_writer.running()) {
    throw std::logic_error{ std::string{ "refpack::tui::" } + what + " called while running" };
  }
}

void log_va(level severity, char const *fmt, va_list args) {
  if (!s_writer.initialized || !fmt || !s_writer.accepts(severity)) { return; }
  auto text{ vformat(fmt, args) };
  if (text.empty()) { return; }
  s_writer.push(log_line{ severity, clock_type::now(), std::move(text) });
}

}  // namespace

namespace refpack::tui {

void init() {
  if (s_writer.initialized) {
    throw std::logic_error{ "refpack::tui::init called more than once" };
  }
  s_writer.initialized = true;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  require_idle("configure_trace_outputs");

  bool to_log{ false };
  std::optional<std::filesystem::path> file_path;
  for (auto const &spec : outputs) {
    if (spec.type == trace_output_type::std_err) {
      to_log = true;
    } else if (spec.file_path) {
      if (file_path) { throw std::logic_error{ "Only one trace file output supported" }; }
      file_path = spec.file_path;
    }
  }

  std::FILE *file{ nullptr };
  if (file_path) {
    file = std::fopen(file_path->string().c_str(), "w");
    if (!file) { throw std::runtime_error("Failed to open trace file: " + file_path->string()); }
  }

  s_writer.set_trace_outputs(to_log, file);
  g_trace_enabled = s_writer.tracing();
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  require_idle("set_output_handler");
  s_writer.set_handler(std::move(handler));
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_writer.initialized) {
    throw std::logic_error{ "refpack::tui::run called before init" };
  }
  if (s_writer.running()) {
    throw std::logic_error{ "refpack::tui::run called while already running" };
  }
  s_writer.start(threshold, decorated_logging);
}

void shutdown() {
  if (!s_writer.running()) {
    throw std::logic_error{ "refpack::tui::shutdown called while not running" };
  }
  s_writer.stop();
  g_trace_enabled = false;
}

std::string_view level_tag(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

std::string format_line(level severity, std::string_view message, bool decorated) {
  return render(severity, message, decorated, clock_type::now());
}

void trace(trace_event_t event) {
  if (!g_trace_enabled || !s_writer.running()) { return; }
  s_writer.push(std::move(event));
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_va(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_va(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_va(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_va(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }
  va_list args;
  va_start(args, fmt);
  s_writer.print(fmt, args);
  va_end(args);
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_writer.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace refpack::tui
