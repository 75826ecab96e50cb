#pragma once

#include "step_catalog.h"

#include <filesystem>
#include <optional>

namespace provision {

struct loaded_catalog {
  step_catalog catalog;
  std::optional<std::filesystem::path> manifest_path;  // nullopt: built-in catalog

  // Directory steps run in when their entry names no cwd.
  std::optional<std::filesystem::path> root() const;
};

loaded_catalog load_catalog(std::optional<std::filesystem::path> const &manifest_path);

}  // namespace provision
