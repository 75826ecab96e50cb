#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <string>

namespace CLI { class App; }

namespace provision {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_version(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

// Version of the tool and of the libraries it was built against, one per line.
std::string cmd_version_report(std::filesystem::path const &exe_path);

}  // namespace provision
