#include "cmd_run.h"

#include "cmd_common.h"
#include "sequencer.h"
#include "shell.h"
#include "shell_action.h"
#include "step_catalog.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <string>
#include <utility>

namespace provision {

void cmd_run::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("run", "Run the provisioning sequence (default)") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_run::cmd_run(cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_run::execute() {
  auto const loaded{ load_catalog(cfg_.manifest_path) };
  if (loaded.manifest_path) {
    tui::info("Using manifest %s", loaded.manifest_path->string().c_str());
  }

  shell_action_cfg const action_cfg{ .shell = loaded.catalog.shell,
                                     .env = shell_getenv(),
                                     .default_cwd = loaded.root(),
                                     .echo_output = true };

  auto const steps{ step_catalog_build_steps(
      loaded.catalog,
      [&action_cfg](catalog_entry const &entry) {
        return shell_action_make(entry, action_cfg);
      }) };

  auto const result{ sequencer_run(steps) };
  auto const description{ outcome_describe(result, steps.size()) };

  if (!outcome_completed_ok(result)) {
    tui::error("Provisioning failed: %s", description.c_str());
    return false;
  }

  tui::info("Provisioning %s", description.c_str());
  return true;
}

}  // namespace provision
