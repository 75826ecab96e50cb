#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iterator>
#include <vector>

namespace provision {

namespace {

struct field {
  char const *key;
  std::variant<std::string_view, std::int64_t, bool> value;
};

using fields_t = std::vector<field>;

// Payload of each event in rendering order. Views point into `event`.
fields_t fields_of(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::manifest_loaded const &e) -> fields_t {
            return { { "manifest_path", e.manifest_path },
                     { "catalog_size", std::int64_t{ e.catalog_size } } };
          },
          [](trace_events::step_excluded const &e) -> fields_t {
            return { { "step", e.step }, { "reason", e.reason } };
          },
          [](trace_events::sequence_start const &e) -> fields_t {
            return { { "step_count", std::int64_t{ e.step_count } } };
          },
          [](trace_events::step_start const &e) -> fields_t {
            return { { "step", e.step }, { "position", std::int64_t{ e.position } } };
          },
          [](trace_events::step_complete const &e) -> fields_t {
            return { { "step", e.step },
                     { "position", std::int64_t{ e.position } },
                     { "duration_ms", e.duration_ms } };
          },
          [](trace_events::step_failed const &e) -> fields_t {
            return { { "step", e.step },
                     { "position", std::int64_t{ e.position } },
                     { "detail", e.detail },
                     { "duration_ms", e.duration_ms } };
          },
          [](trace_events::sequence_complete const &e) -> fields_t {
            return { { "completed", e.completed },
                     { "steps_run", std::int64_t{ e.steps_run } },
                     { "duration_ms", e.duration_ms } };
          },
          [](trace_events::shell_run_start const &e) -> fields_t {
            return { { "step", e.step }, { "command", e.command }, { "cwd", e.cwd } };
          },
          [](trace_events::shell_run_complete const &e) -> fields_t {
            return { { "step", e.step },
                     { "exit_code", std::int64_t{ e.exit_code } },
                     { "duration_ms", e.duration_ms } };
          },
      },
      event);
}

// 2024-05-01T13:37:00.123Z
std::string utc_timestamp_now() {
  auto const now{ std::chrono::system_clock::now() };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                     now.time_since_epoch())
                     .count() %
                 1000 };
  std::time_t const secs{ std::chrono::system_clock::to_time_t(now) };
  std::tm utc{};
  gmtime_r(&secs, &utc);

  char buf[32]{};
  auto const n{ std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%S", &utc) };
  std::snprintf(buf + n, sizeof buf - n, ".%03dZ", static_cast<int>(ms));
  return buf;
}

void append_json_escaped(std::string &out, std::string_view s) {
  out.push_back('"');
  for (char const c : s) {
    switch (c) {
      case '"': out.append("\\\""); break;
      case '\\': out.append("\\\\"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char hex[8]{};
          std::snprintf(hex, sizeof hex, "\\u%04x", static_cast<unsigned char>(c));
          out.append(hex);
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

}  // namespace

std::int64_t trace_elapsed_ms(std::chrono::steady_clock::time_point start) {
  auto const elapsed{ std::chrono::steady_clock::now() - start };
  return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

std::string_view trace_event_name(trace_event_t const &event) {
  constexpr std::string_view kNames[]{
    "manifest_loaded", "step_excluded",     "sequence_start",
    "step_start",      "step_complete",     "step_failed",
    "sequence_complete", "shell_run_start", "shell_run_complete",
  };
  static_assert(std::size(kNames) == std::variant_size_v<trace_event_t>);
  return kNames[event.index()];
}

std::string trace_event_to_string(trace_event_t const &event) {
  std::string out{ trace_event_name(event) };
  for (auto const &[key, value] : fields_of(event)) {
    out.push_back(' ');
    out.append(key);
    out.push_back('=');
    std::visit(match{ [&](std::string_view s) { out.append(s); },
                      [&](std::int64_t n) { out.append(std::to_string(n)); },
                      [&](bool b) { out.append(b ? "true" : "false"); } },
               value);
  }
  return out;
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string out{ "{\"ts\":\"" + utc_timestamp_now() + "\",\"event\":" };
  append_json_escaped(out, trace_event_name(event));

  for (auto const &[key, value] : fields_of(event)) {
    out.append(",\"");
    out.append(key);
    out.append("\":");
    std::visit(match{ [&](std::string_view s) { append_json_escaped(out, s); },
                      [&](std::int64_t n) { out.append(std::to_string(n)); },
                      [&](bool b) { out.append(b ? "true" : "false"); } },
               value);
  }

  out.push_back('}');
  return out;
}

}  // namespace provision
