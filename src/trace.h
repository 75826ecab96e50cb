#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace provision {

namespace trace_events {

struct manifest_loaded {
  std::string manifest_path;
  int catalog_size;
};

struct step_excluded {
  std::string step;
  std::string reason;
};

struct sequence_start {
  int step_count;
};

struct step_start {
  std::string step;
  int position;
};

struct step_complete {
  std::string step;
  int position;
  std::int64_t duration_ms;
};

struct step_failed {
  std::string step;
  int position;
  std::string detail;
  std::int64_t duration_ms;
};

struct sequence_complete {
  bool completed;
  int steps_run;
  std::int64_t duration_ms;
};

struct shell_run_start {
  std::string step;
  std::string command;
  std::string cwd;
};

struct shell_run_complete {
  std::string step;
  int exit_code;
  std::int64_t duration_ms;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::manifest_loaded,
                                   trace_events::step_excluded,
                                   trace_events::sequence_start,
                                   trace_events::step_start,
                                   trace_events::step_complete,
                                   trace_events::step_failed,
                                   trace_events::sequence_complete,
                                   trace_events::shell_run_start,
                                   trace_events::shell_run_complete>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

std::int64_t trace_elapsed_ms(std::chrono::steady_clock::time_point start);

}  // namespace provision

#define PROVISION_TRACE_UNLIKELY [[unlikely]]

#define PROVISION_TRACE_EMIT(event_expr) \
  do { \
    if (::provision::tui::g_trace_enabled) PROVISION_TRACE_UNLIKELY { \
        ::provision::tui::trace event_expr; \
      } \
  } while (0)

#define PROVISION_TRACE_MANIFEST_LOADED(path_value, catalog_size_value) \
  PROVISION_TRACE_EMIT((::provision::trace_events::manifest_loaded{ \
      .manifest_path = (path_value), \
      .catalog_size = (catalog_size_value), \
  }))

#define PROVISION_TRACE_STEP_EXCLUDED(step_value, reason_value) \
  PROVISION_TRACE_EMIT((::provision::trace_events::step_excluded{ \
      .step = (step_value), \
      .reason = (reason_value), \
  }))

#define PROVISION_TRACE_SEQUENCE_START(step_count_value) \
  PROVISION_TRACE_EMIT((::provision::trace_events::sequence_start{ \
      .step_count = (step_count_value), \
  }))

#define PROVISION_TRACE_STEP_START(step_value, position_value) \
  PROVISION_TRACE_EMIT((::provision::trace_events::step_start{ \
      .step = (step_value), \
      .position = (position_value), \
  }))

#define PROVISION_TRACE_STEP_COMPLETE(step_value, position_value, duration_value) \
  PROVISION_TRACE_EMIT((::provision::trace_events::step_complete{ \
      .step = (step_value), \
      .position = (position_value), \
      .duration_ms = (duration_value), \
  }))

#define PROVISION_TRACE_STEP_FAILED(step_value, \
                                    position_value, \
                                    detail_value, \
                                    duration_value) \
  PROVISION_TRACE_EMIT((::provision::trace_events::step_failed{ \
      .step = (step_value), \
      .position = (position_value), \
      .detail = (detail_value), \
      .duration_ms = (duration_value), \
  }))

#define PROVISION_TRACE_SEQUENCE_COMPLETE(completed_value, \
                                          steps_run_value, \
                                          duration_value) \
  PROVISION_TRACE_EMIT((::provision::trace_events::sequence_complete{ \
      .completed = (completed_value), \
      .steps_run = (steps_run_value), \
      .duration_ms = (duration_value), \
  }))

#define PROVISION_TRACE_SHELL_RUN_START(step_value, command_value, cwd_value) \
  PROVISION_TRACE_EMIT((::provision::trace_events::shell_run_start{ \
      .step = (step_value), \
      .command = (command_value), \
      .cwd = (cwd_value), \
  }))

#define PROVISION_TRACE_SHELL_RUN_COMPLETE(step_value, exit_code_value, duration_value) \
  PROVISION_TRACE_EMIT((::provision::trace_events::shell_run_complete{ \
      .step = (step_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = (duration_value), \
  }))
