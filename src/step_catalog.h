#pragma once

#include "shell.h"
#include "step.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace provision {

struct catalog_entry {
  std::string name;
  std::string description;
  std::string script;
  bool enabled{ true };
  std::optional<std::filesystem::path> cwd;
};

// Every step the configuration knows about, enabled or not, plus an optional explicit
// active sequence naming catalog entries.
struct step_catalog {
  std::vector<catalog_entry> entries;
  std::optional<std::vector<std::string>> sequence;
  shell_choice shell{ shell_choice::bash };
};

// install-dependencies, collect-static-assets, create-admin-user (disabled),
// apply-migrations.
step_catalog step_catalog_default();

catalog_entry const *step_catalog_find(step_catalog const &catalog,
                                       std::string_view name);

// Throws configuration_error on blank names, blank scripts or duplicate names.
void step_catalog_validate(step_catalog const &catalog);

// Entries of the active sequence, in execution order. Throws configuration_error when a
// sequence name is unknown or disabled.
std::vector<catalog_entry const *> step_catalog_active(step_catalog const &catalog);

using step_action_factory = std::function<step_action(catalog_entry const &)>;

std::vector<step> step_catalog_build_steps(step_catalog const &catalog,
                                           step_action_factory const &make_action);

}  // namespace provision
