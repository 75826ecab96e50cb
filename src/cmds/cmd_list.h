#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace provision {

struct step_catalog;

class cmd_list : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_list> {
    std::optional<std::filesystem::path> manifest_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_list(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

// One line per catalog entry: position in the active sequence (or '-' when excluded),
// name, state and flattened script.
std::string cmd_list_format(step_catalog const &catalog);

}  // namespace provision
