#include "sequencer.h"

#include "trace.h"
#include "tui.h"
#include "util.h"

#include <chrono>
#include <unordered_set>

namespace provision {

bool outcome_completed_ok(outcome const &o) {
  return std::holds_alternative<outcome_completed>(o);
}

std::string outcome_describe(outcome const &o, std::size_t step_count) {
  return std::visit(
      match{
          [step_count](outcome_completed const &) {
            return "completed " + std::to_string(step_count) + " step" +
                   (step_count == 1 ? "" : "s");
          },
          [step_count](outcome_failed const &f) {
            return "step '" + f.step + "' (" + std::to_string(f.position) + "/" +
                   std::to_string(step_count) + ") failed: " + f.detail;
          },
      },
      o);
}

void sequencer_validate(std::vector<step> const &steps) {
  if (steps.empty()) {
    throw configuration_error("step sequence is empty; nothing to provision");
  }

  std::unordered_set<std::string> seen;
  for (std::size_t i{ 0 }; i < steps.size(); ++i) {
    auto const &s{ steps[i] };
    if (s.name.empty()) {
      throw configuration_error("step at position " + std::to_string(i + 1) +
                                " has no name");
    }
    if (!s.action) {
      throw configuration_error("step '" + s.name + "' has no action");
    }
    if (!s.required) {
      throw configuration_error("step '" + s.name +
                                "' is not required; every step in a sequence must be");
    }
    if (!seen.insert(s.name).second) {
      throw configuration_error("step '" + s.name + "' appears more than once");
    }
  }
}

outcome sequencer_run(std::vector<step> const &steps) {
  sequencer_validate(steps);

  int const count{ static_cast<int>(steps.size()) };
  auto const sequence_start{ std::chrono::steady_clock::now() };
  PROVISION_TRACE_SEQUENCE_START(count);

  for (int i{ 0 }; i < count; ++i) {
    auto const &s{ steps[static_cast<std::size_t>(i)] };
    int const position{ i + 1 };

    tui::info("[%d/%d] %s", position, count, s.name.c_str());
    PROVISION_TRACE_STEP_START(s.name, position);

    auto const step_start{ std::chrono::steady_clock::now() };
    step_result const result{ s.action() };
    auto const duration_ms{ trace_elapsed_ms(step_start) };

    if (!result.ok) {
      tui::error("step '%s' failed after %lldms: %s",
                 s.name.c_str(),
                 static_cast<long long>(duration_ms),
                 result.detail.c_str());
      PROVISION_TRACE_STEP_FAILED(s.name, position, result.detail, duration_ms);
      PROVISION_TRACE_SEQUENCE_COMPLETE(false, position, trace_elapsed_ms(sequence_start));
      return outcome_failed{ .step = s.name,
                             .position = static_cast<std::size_t>(position),
                             .detail = result.detail };
    }

    tui::debug("step '%s' completed in %lldms",
               s.name.c_str(),
               static_cast<long long>(duration_ms));
    PROVISION_TRACE_STEP_COMPLETE(s.name, position, duration_ms);
  }

  PROVISION_TRACE_SEQUENCE_COMPLETE(true, count, trace_elapsed_ms(sequence_start));
  return outcome_completed{};
}

}  // namespace provision
