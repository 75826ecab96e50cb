#pragma once

#include "shell.h"
#include "step.h"
#include "step_catalog.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace provision {

struct shell_action_cfg {
  shell_choice shell{ shell_choice::bash };
  shell_env_t env;
  std::optional<std::filesystem::path> default_cwd;  // used when the entry has no cwd
  bool echo_output{ true };                          // log child output at info level
};

// Step action that runs the entry's script in a child shell. Exit code 0 is success;
// anything else is a failure whose detail names the child's last words.
step_action shell_action_make(catalog_entry const &entry, shell_action_cfg cfg);

// "<last stderr line> (exit code N)", falling back to the last stdout line, or
// "terminated by signal N" when the child was killed.
std::string shell_action_failure_detail(shell_result const &result,
                                        std::vector<std::string> const &stderr_tail,
                                        std::vector<std::string> const &stdout_tail);

}  // namespace provision
