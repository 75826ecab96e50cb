#include "shell_action.h"

#include "trace.h"
#include "tui.h"
#include "util.h"

#include <chrono>
#include <cstddef>
#include <system_error>
#include <utility>

namespace provision {

namespace {

constexpr std::size_t kTailLines{ 20 };

void append_tail(std::vector<std::string> &tail, std::string_view line) {
  if (tail.size() == kTailLines) { tail.erase(tail.begin()); }
  tail.emplace_back(line);
}

}  // namespace

std::string shell_action_failure_detail(shell_result const &result,
                                        std::vector<std::string> const &stderr_tail,
                                        std::vector<std::string> const &stdout_tail) {
  if (result.signal) { return "terminated by signal " + std::to_string(*result.signal); }

  auto last{ util_last_nonblank_line(stderr_tail) };
  if (last.empty()) { last = util_last_nonblank_line(stdout_tail); }

  std::string const status{ "exit code " + std::to_string(result.exit_code) };
  return last.empty() ? status : last + " (" + status + ")";
}

step_action shell_action_make(catalog_entry const &entry, shell_action_cfg cfg) {
  std::optional<std::filesystem::path> cwd{ entry.cwd ? entry.cwd : cfg.default_cwd };

  return [name = entry.name,
          script = entry.script,
          cwd = std::move(cwd),
          cfg = std::move(cfg)]() -> step_result {
    std::vector<std::string> stdout_tail;
    std::vector<std::string> stderr_tail;

    PROVISION_TRACE_SHELL_RUN_START(name,
                                    util_flatten_script_with_semicolons(script),
                                    cwd ? cwd->string() : std::string{ "." });
    tui::debug("%s: %s", name.c_str(), util_flatten_script_with_semicolons(script).c_str());

    shell_run_cfg const inv{
      .on_output_line =
          [&](std::string_view line) {
            if (cfg.echo_output) {
              tui::info("%s: %s", name.c_str(), std::string{ line }.c_str());
            }
          },
      .on_stdout_line = [&](std::string_view line) { append_tail(stdout_tail, line); },
      .on_stderr_line = [&](std::string_view line) { append_tail(stderr_tail, line); },
      .cwd = cwd,
      .env = cfg.env,
      .shell = cfg.shell,
    };

    auto const start_time{ std::chrono::steady_clock::now() };

    shell_result result{};
    try {
      result = shell_run(script, inv);
    } catch (std::system_error const &e) {
      return step_result::failure(std::string{ "could not run step: " } + e.what());
    }

    PROVISION_TRACE_SHELL_RUN_COMPLETE(name, result.exit_code, trace_elapsed_ms(start_time));

    if (result.exit_code == 0 && !result.signal) { return step_result::success(); }
    return step_result::failure(
        shell_action_failure_detail(result, stderr_tail, stdout_tail));
  };
}

}  // namespace provision
