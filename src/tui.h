#pragma once

#include "trace.h"
#include "util.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#if defined(__clang__) || defined(__GNUC__)
#define PROVISION_LOG_FORMAT(fmt_idx, args_idx) \
  __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define PROVISION_LOG_FORMAT(fmt_idx, args_idx)
#endif

// Process-wide log sink. Lines are written to stderr (or to the handler installed with
// set_output_handler) while the sink is running; anything logged while it is stopped is
// discarded.
namespace provision::tui {

enum class level { TUI_TRACE, TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

enum class trace_output_type { std_err, file };

struct trace_output_spec {
  trace_output_type type;
  std::optional<std::filesystem::path> file_path;  // required for trace_output_type::file
};

void init();  // once per process

// Only valid while stopped. At most one file output; the file is truncated.
void configure_trace_outputs(std::vector<trace_output_spec> outputs);
void set_output_handler(std::function<void(std::string_view)> handler);

// threshold: messages below it are dropped (nullopt keeps everything).
// decorated_logging: prefix each line with a local timestamp and level label.
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();  // stops the sink and closes trace outputs

void trace(trace_event_t event);

void debug(char const *fmt, ...) PROVISION_LOG_FORMAT(1, 2);
void info(char const *fmt, ...) PROVISION_LOG_FORMAT(1, 2);
void warn(char const *fmt, ...) PROVISION_LOG_FORMAT(1, 2);
void error(char const *fmt, ...) PROVISION_LOG_FORMAT(1, 2);

// Command output for stdout, unaffected by level or decoration.
void print_stdout(char const *fmt, ...) PROVISION_LOG_FORMAT(1, 2);

// Runs the sink for the lifetime of the object. Does nothing before init().
class scope : unmovable {
 public:
  scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool started_{ false };
};

}  // namespace provision::tui

#undef PROVISION_LOG_FORMAT
