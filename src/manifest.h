#pragma once

#include "step_catalog.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace provision {

inline constexpr std::string_view kManifestFilename{ "provision.lua" };

struct manifest : unmovable {
  std::filesystem::path manifest_path;
  step_catalog catalog;

  manifest() = default;

  // Explicit path must exist (throws otherwise). Without one, discover from the current
  // directory; nullopt means no manifest and the built-in catalog applies.
  static std::optional<std::filesystem::path> find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  // Walks up from the current directory looking for provision.lua, stopping at a
  // directory holding a .git directory.
  static std::optional<std::filesystem::path> discover();

  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(std::string_view script,
                                        std::filesystem::path const &manifest_path);
};

}  // namespace provision
