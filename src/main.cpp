#include "cli.h"
#include "sequencer.h"
#include "tui.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <stdexcept>
#include <variant>

int main(int argc, char **argv) {
  provision::tui::init();

  auto args{ provision::cli_parse(argc, argv) };
  provision::tui::configure_trace_outputs(args.trace_outputs);

  std::optional<provision::tui::scope> tui_scope;
  try {
    tui_scope.emplace(args.verbosity, args.decorated_logging);
  } catch (std::runtime_error const &ex) {
    std::fprintf(stderr, "%s\n", ex.what());
    return EXIT_FAILURE;
  }

  if (args.help_requested) {
    provision::tui::print_stdout("%s", args.cli_output.c_str());
    return EXIT_SUCCESS;
  }

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      provision::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    provision::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return provision::cmd::create(cfg); },
                       *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (provision::configuration_error const &ex) {
    provision::tui::error("Configuration error: %s", ex.what());
    return EXIT_FAILURE;
  } catch (std::exception const &ex) {
    provision::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
