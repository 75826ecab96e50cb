#include "manifest.h"

#include "sequencer.h"
#include "sol_util.h"
#include "trace.h"
#include "tui.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace provision {

namespace {

catalog_entry parse_entry(sol::object const &obj,
                          std::size_t index,
                          std::filesystem::path const &manifest_dir) {
  std::string const context{ "STEPS[" + std::to_string(index) + "]" };
  if (!obj.is<sol::table>()) { throw std::runtime_error(context + " must be a table"); }
  sol::table const tbl{ obj.as<sol::table>() };

  catalog_entry entry;
  entry.name = sol_util_required_field<std::string>(tbl, "name", context);
  entry.script = sol_util_required_field<std::string>(tbl, "run", context);
  entry.description = sol_util_field<std::string>(tbl, "description", context).value_or("");
  entry.enabled = sol_util_field<bool>(tbl, "enabled", context).value_or(true);

  if (auto const cwd{ sol_util_field<std::string>(tbl, "cwd", context) }) {
    std::filesystem::path const p{ *cwd };
    entry.cwd = p.is_absolute() ? p : manifest_dir / p;
  }

  return entry;
}

std::vector<std::string> parse_sequence(sol::object const &obj) {
  if (!obj.is<sol::table>()) {
    throw std::runtime_error("SEQUENCE must be an array of step names");
  }
  sol::table const tbl{ obj.as<sol::table>() };

  std::vector<std::string> names;
  for (std::size_t i{ 1 }; i <= tbl.size(); ++i) {
    sol::object const elem = tbl[i];
    if (!elem.is<std::string>()) {
      throw std::runtime_error("SEQUENCE[" + std::to_string(i) + "] must be a string");
    }
    names.push_back(elem.as<std::string>());
  }
  return names;
}

step_catalog parse_catalog(sol::state &lua, std::filesystem::path const &manifest_path) {
  auto const manifest_dir{ manifest_path.parent_path() };
  step_catalog catalog;

  sol::object const steps_obj = lua["STEPS"];
  if (!steps_obj.valid() || steps_obj.get_type() == sol::type::lua_nil) {
    tui::debug("Manifest defines no STEPS; using built-in catalog");
    catalog.entries = step_catalog_default().entries;
  } else {
    if (steps_obj.get_type() != sol::type::table) {
      throw std::runtime_error("STEPS must be an array of tables");
    }
    sol::table const steps_table{ steps_obj.as<sol::table>() };
    for (std::size_t i{ 1 }; i <= steps_table.size(); ++i) {
      sol::object const entry_obj = steps_table[i];
      catalog.entries.push_back(parse_entry(entry_obj, i, manifest_dir));
    }
  }

  sol::object const sequence_obj = lua["SEQUENCE"];
  if (sequence_obj.valid() && sequence_obj.get_type() != sol::type::lua_nil) {
    catalog.sequence = parse_sequence(sequence_obj);
  }

  sol::object const shell_obj = lua["SHELL"];
  if (shell_obj.valid() && shell_obj.get_type() != sol::type::lua_nil) {
    if (!shell_obj.is<std::string>()) { throw std::runtime_error("SHELL must be a string"); }
    catalog.shell = shell_parse_choice(shell_obj.as<std::string>());
  }

  return catalog;
}

}  // namespace

std::optional<std::filesystem::path> manifest::discover() {
  namespace fs = std::filesystem;

  auto cur{ fs::current_path() };

  for (;;) {
    auto const manifest_path{ cur / kManifestFilename };
    if (fs::exists(manifest_path)) { return manifest_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::optional<std::filesystem::path> manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw configuration_error("manifest not found: " + path.string());
    }
    return path;
  }
  return discover();
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());
  std::string content;
  try {
    content = util_load_file(manifest_path);
  } catch (std::runtime_error const &e) {
    throw configuration_error(e.what());
  }
  return load(content, manifest_path);
}

std::unique_ptr<manifest> manifest::load(std::string_view script,
                                         std::filesystem::path const &manifest_path) {
  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw configuration_error(manifest_path.string() +
                              ": failed to execute manifest script: " + err.what());
  }

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = manifest_path;

  try {
    m->catalog = parse_catalog(*state, manifest_path);
  } catch (std::invalid_argument const &e) {
    throw configuration_error(manifest_path.string() + ": " + e.what());
  } catch (std::runtime_error const &e) {
    throw configuration_error(manifest_path.string() + ": " + e.what());
  }

  step_catalog_validate(m->catalog);

  PROVISION_TRACE_MANIFEST_LOADED(manifest_path.string(),
                                  static_cast<int>(m->catalog.entries.size()));
  return m;
}

}  // namespace provision
