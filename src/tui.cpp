#include "tui.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace provision::tui {

bool g_trace_enabled{ false };

namespace {

struct sink {
  std::mutex mutex;  // serializes every write and all state below
  std::function<void(std::string_view)> handler;
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };
  bool running{ false };
  bool trace_stderr{ false };
  std::optional<std::filesystem::path> trace_path;
  file_ptr_t trace_file;
};

sink &the_sink() {
  static sink s;
  return s;
}

char const *level_label(level l) {
  switch (l) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[2024-05-01 13:37:00.123] [INF] "
std::string line_prefix(level l) {
  auto const now{ std::chrono::system_clock::now() };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                     now.time_since_epoch())
                     .count() %
                 1000 };
  std::time_t const t{ std::chrono::system_clock::to_time_t(now) };
  std::tm local{};
  localtime_r(&t, &local);

  char stamp[24]{};
  std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local);

  char prefix[48]{};
  std::snprintf(prefix,
                sizeof prefix,
                "[%s.%03d] [%s] ",
                stamp,
                static_cast<int>(ms),
                level_label(l));
  return prefix;
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

// Caller holds the mutex.
void write_line(sink &s, std::string const &line) {
  if (s.handler) {
    s.handler(line);
    return;
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
  std::fflush(stderr);
}

void log(level l, char const *fmt, va_list args) {
  auto &s{ the_sink() };
  if (!fmt) { return; }

  std::string message{ vformat(fmt, args) };
  if (message.empty()) { return; }

  std::lock_guard const lock{ s.mutex };
  if (!s.running || (s.threshold && l < *s.threshold)) { return; }

  std::string line{ s.decorated ? line_prefix(l) : std::string{} };
  line.append(message);
  line.push_back('\n');
  write_line(s, line);
}

void require_stopped(sink const &s, char const *what) {
  if (!s.initialized) {
    throw std::logic_error{ std::string{ "tui::" } + what + " called before init" };
  }
  if (s.running) {
    throw std::logic_error{ std::string{ "tui::" } + what + " called while running" };
  }
}

}  // namespace

void init() {
  auto &s{ the_sink() };
  std::lock_guard const lock{ s.mutex };
  if (s.initialized) { throw std::logic_error{ "tui::init called more than once" }; }
  s.initialized = true;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  auto &s{ the_sink() };
  std::lock_guard const lock{ s.mutex };
  require_stopped(s, "configure_trace_outputs");

  bool to_stderr{ false };
  std::optional<std::filesystem::path> path;
  for (auto &out : outputs) {
    if (out.type == trace_output_type::std_err) {
      to_stderr = true;
      continue;
    }
    if (!out.file_path) { throw std::invalid_argument{ "trace file output needs a path" }; }
    if (path) { throw std::logic_error{ "Only one trace file output supported" }; }
    path = std::move(out.file_path);
  }

  s.trace_stderr = to_stderr;
  s.trace_path = std::move(path);
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  auto &s{ the_sink() };
  std::lock_guard const lock{ s.mutex };
  require_stopped(s, "set_output_handler");
  s.handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  auto &s{ the_sink() };
  std::lock_guard const lock{ s.mutex };
  require_stopped(s, "run");

  if (s.trace_path) {
    s.trace_file = util_open_file(*s.trace_path, "w");
    if (!s.trace_file) {
      throw std::runtime_error("Failed to open trace file: " + s.trace_path->string());
    }
  }

  s.threshold = threshold;
  s.decorated = decorated_logging;
  s.running = true;
  g_trace_enabled = s.trace_stderr || s.trace_file;
}

void shutdown() {
  auto &s{ the_sink() };
  std::lock_guard const lock{ s.mutex };
  if (!s.running) { throw std::logic_error{ "tui::shutdown called while not running" }; }

  s.running = false;
  g_trace_enabled = false;
  s.trace_file.reset();
}

void trace(trace_event_t event) {
  auto &s{ the_sink() };
  std::lock_guard const lock{ s.mutex };
  if (!s.running) { return; }

  if (s.trace_stderr) {
    std::string line{ s.decorated ? line_prefix(level::TUI_TRACE) : std::string{} };
    line.append(trace_event_to_string(event));
    line.push_back('\n');
    write_line(s, line);
  }

  if (s.trace_file) {
    auto const json{ trace_event_to_json(event) + "\n" };
    if (std::fwrite(json.data(), 1, json.size(), s.trace_file.get()) != json.size() ||
        std::fflush(s.trace_file.get()) != 0) {
      s.trace_file.reset();
      g_trace_enabled = s.trace_stderr;
      write_line(s, "Trace file write failed; file tracing disabled\n");
    }
  }
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  va_list args;
  va_start(args, fmt);
  std::string const text{ vformat(fmt, args) };
  va_end(args);

  auto &s{ the_sink() };
  std::lock_guard const lock{ s.mutex };
  std::fwrite(text.data(), 1, text.size(), stdout);
  std::fflush(stdout);
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!the_sink().initialized) { return; }
  run(threshold, decorated_logging);
  started_ = true;
}

scope::~scope() {
  if (started_) { shutdown(); }
}

}  // namespace provision::tui
