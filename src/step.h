#pragma once

#include <functional>
#include <string>
#include <utility>

namespace provision {

// Result of one step's action. The action owns what "partial success" means; the
// sequencer only sees success or failure with a detail string.
struct step_result {
  bool ok{ false };
  std::string detail;

  static step_result success() { return { true, {} }; }
  static step_result failure(std::string detail) { return { false, std::move(detail) }; }

  bool operator==(step_result const &) const = default;
};

using step_action = std::function<step_result()>;

struct step {
  std::string name;
  step_action action;
  bool required{ true };
};

}  // namespace provision
