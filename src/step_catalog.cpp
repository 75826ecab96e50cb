#include "step_catalog.h"

#include "sequencer.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <unordered_set>

namespace provision {

namespace {

bool is_blank(std::string_view s) {
  return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

}  // namespace

step_catalog step_catalog_default() {
  step_catalog catalog;
  catalog.entries = {
    { .name = "install-dependencies",
      .description = "Install the declared dependency manifest",
      .script = "pip install -r requirements.txt\n"
                "pip install --upgrade pip\n" },
    { .name = "collect-static-assets",
      .description = "Publish static assets to the serving location",
      .script = "python manage.py collectstatic --no-input\n" },
    { .name = "create-admin-user",
      .description = "Create the administrator account if none exists",
      .script = "python manage.py initadmin\n",
      .enabled = false },
    { .name = "apply-migrations",
      .description = "Apply outstanding schema migrations",
      .script = "python manage.py migrate\n" },
  };
  return catalog;
}

catalog_entry const *step_catalog_find(step_catalog const &catalog,
                                       std::string_view name) {
  for (auto const &entry : catalog.entries) {
    if (entry.name == name) { return &entry; }
  }
  return nullptr;
}

void step_catalog_validate(step_catalog const &catalog) {
  std::unordered_set<std::string> seen;
  for (auto const &entry : catalog.entries) {
    if (is_blank(entry.name)) {
      throw configuration_error("catalog entry has a blank name");
    }
    if (is_blank(entry.script)) {
      throw configuration_error("catalog entry '" + entry.name + "' has no script");
    }
    if (!seen.insert(entry.name).second) {
      throw configuration_error("catalog entry '" + entry.name + "' defined more than once");
    }
  }
}

std::vector<catalog_entry const *> step_catalog_active(step_catalog const &catalog) {
  step_catalog_validate(catalog);

  std::vector<catalog_entry const *> active;

  if (!catalog.sequence) {
    for (auto const &entry : catalog.entries) {
      if (entry.enabled) {
        active.push_back(&entry);
      } else {
        tui::debug("step '%s' is disabled; excluded from sequence", entry.name.c_str());
        PROVISION_TRACE_STEP_EXCLUDED(entry.name, "disabled");
      }
    }
    return active;
  }

  for (auto const &name : *catalog.sequence) {
    auto const *entry{ step_catalog_find(catalog, name) };
    if (!entry) {
      throw configuration_error("sequence references unknown step '" + name + "'");
    }
    if (!entry->enabled) {
      throw configuration_error("sequence references disabled step '" + name + "'");
    }
    active.push_back(entry);
  }

  for (auto const &entry : catalog.entries) {
    bool const listed{ std::find(catalog.sequence->begin(),
                                 catalog.sequence->end(),
                                 entry.name) != catalog.sequence->end() };
    if (!listed) {
      PROVISION_TRACE_STEP_EXCLUDED(entry.name,
                                    entry.enabled ? "not in sequence" : "disabled");
    }
  }

  return active;
}

std::vector<step> step_catalog_build_steps(step_catalog const &catalog,
                                           step_action_factory const &make_action) {
  std::vector<step> steps;
  for (auto const *entry : step_catalog_active(catalog)) {
    steps.push_back({ .name = entry->name, .action = make_action(*entry) });
  }
  return steps;
}

}  // namespace provision
