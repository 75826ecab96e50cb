#pragma once

#include "cmds/cmd_list.h"
#include "cmds/cmd_run.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace provision {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_run::cfg, cmd_list::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
  bool help_requested{ false };
};

// Parses argv. With no subcommand the run command is selected. Help and parse errors
// leave cmd_cfg empty and put the text in cli_output; help also sets help_requested.
cli_args cli_parse(int argc, char **argv);

}  // namespace provision
