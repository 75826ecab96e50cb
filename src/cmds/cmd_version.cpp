#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "CLI/CLI.hpp"
#include "sol/sol.hpp"

#include <string>
#include <utility>

#ifndef PROVISION_VERSION_STR
#error "PROVISION_VERSION_STR must be defined by the build system"
#endif

namespace provision {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

std::string cmd_version_report(std::filesystem::path const &exe_path) {
  std::string report{ "provision " PROVISION_VERSION_STR "\n" };
  report += "  binary  " + exe_path.string() + "\n";
  report += "  lua     " LUA_RELEASE "\n";
  report += "  sol2    " SOL_VERSION_STRING "\n";
  report += "  cli11   " CLI11_VERSION "\n";
  return report;
}

bool cmd_version::execute() {
  tui::print_stdout("%s", cmd_version_report(platform::get_exe_path()).c_str());
  return true;
}

}  // namespace provision
