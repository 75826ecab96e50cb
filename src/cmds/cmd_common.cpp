#include "cmd_common.h"

#include "manifest.h"
#include "tui.h"

#include <string>
#include <utility>

namespace provision {

std::optional<std::filesystem::path> loaded_catalog::root() const {
  if (!manifest_path) { return std::nullopt; }
  return manifest_path->parent_path();
}

loaded_catalog load_catalog(std::optional<std::filesystem::path> const &manifest_path) {
  auto const path{ manifest::find_manifest_path(manifest_path) };
  if (!path) {
    tui::debug("No %s found; using built-in step catalog",
               std::string{ kManifestFilename }.c_str());
    return { .catalog = step_catalog_default(), .manifest_path = std::nullopt };
  }

  auto m{ manifest::load(*path) };
  return { .catalog = std::move(m->catalog), .manifest_path = m->manifest_path };
}

}  // namespace provision
