#pragma once

#include "step.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace provision {

// Misconfigured pipeline: raised before any step runs.
class configuration_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct outcome_completed {
  bool operator==(outcome_completed const &) const = default;
};

struct outcome_failed {
  std::string step;
  std::size_t position;  // 1-based index in the active sequence
  std::string detail;

  bool operator==(outcome_failed const &) const = default;
};

using outcome = std::variant<outcome_completed, outcome_failed>;

bool outcome_completed_ok(outcome const &o);
std::string outcome_describe(outcome const &o, std::size_t step_count);

// Throws configuration_error for an empty sequence, a step without a name or action,
// a non-required step, or duplicate step names.
void sequencer_validate(std::vector<step> const &steps);

// Runs each step's action exactly once, in order, stopping at the first failure. The
// failing step's detail is returned unchanged. Exceptions thrown by an action propagate.
outcome sequencer_run(std::vector<step> const &steps);

}  // namespace provision
