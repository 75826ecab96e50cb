#include "cmd_list.h"

#include "cmd_common.h"
#include "step_catalog.h"
#include "tui.h"
#include "util.h"

#include "CLI/CLI.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

namespace provision {

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("list", "List catalog steps and the active sequence") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_list::cmd_list(cfg cfg) : cfg_{ std::move(cfg) } {}

std::string cmd_list_format(step_catalog const &catalog) {
  auto const active{ step_catalog_active(catalog) };

  std::size_t name_width{ 0 };
  for (auto const &entry : catalog.entries) {
    name_width = std::max(name_width, entry.name.size());
  }

  std::ostringstream oss;
  for (auto const &entry : catalog.entries) {
    auto const it{ std::find(active.begin(), active.end(), &entry) };
    if (it == active.end()) {
      oss << " - ";
    } else {
      oss << (it - active.begin()) + 1 << ". ";
    }

    oss << entry.name << std::string(name_width - entry.name.size() + 2, ' ')
        << (entry.enabled ? "enabled " : "disabled") << "  "
        << util_flatten_script_with_semicolons(entry.script) << '\n';
  }
  return oss.str();
}

bool cmd_list::execute() {
  auto const loaded{ load_catalog(cfg_.manifest_path) };
  tui::print_stdout("%s", cmd_list_format(loaded.catalog).c_str());
  return true;
}

}  // namespace provision
