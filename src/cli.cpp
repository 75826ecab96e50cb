#include "cli.h"
#include "tui.h"
#include "util.h"

#include "CLI/CLI.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace provision {

namespace {

constexpr std::string_view kFilePrefix{ "file:" };

// "stderr", "file:PATH", or a comma-separated mix. Empty means stderr.
std::vector<tui::trace_output_spec> parse_trace_outputs(std::string_view spec) {
  if (spec.empty()) { return { { tui::trace_output_type::std_err, std::nullopt } }; }

  std::vector<tui::trace_output_spec> outputs;
  while (!spec.empty()) {
    auto const comma{ spec.find(',') };
    auto const item{ spec.substr(0, comma) };
    spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);
    if (item.empty()) { continue; }

    if (item == "stderr") {
      outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    } else if (item.size() > kFilePrefix.size() &&
               item.substr(0, kFilePrefix.size()) == kFilePrefix) {
      outputs.push_back({ tui::trace_output_type::file,
                          std::filesystem::path{ item.substr(kFilePrefix.size()) } });
    } else {
      throw std::invalid_argument("Invalid trace output spec: " + std::string{ item });
    }
  }
  return outputs;
}

}  // namespace

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "provision - ordered, fail-fast environment provisioning" };
  app.require_subcommand(0, 1);
  app.fallthrough();

  std::optional<std::filesystem::path> manifest_path;
  app.add_option("--manifest",
                 manifest_path,
                 "Path to provision.lua (searched for upward from the current directory "
                 "when omitted)");

  bool verbose{ false };
  app.add_flag("--verbose", verbose, "Debug logging with timestamp and level on stderr");

  std::string trace_spec;
  auto *const trace_opt{ app.add_option(
      "--trace",
      trace_spec,
      "Trace events to 'stderr' (text) and/or 'file:<path>' (JSONL), comma-separated. "
      "Bare --trace means stderr.") };
  trace_opt->expected(0, 1);

  bool show_version{ false };
  app.add_flag("-v,--version", show_version, "Same as the version command");

  std::optional<cli_args::cmd_cfg_t> selected;
  auto const on_selected{ [&selected](auto cfg) { selected = std::move(cfg); } };
  cmd_run::register_cli(app, on_selected);
  cmd_list::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  cli_args args{};
  bool parsed{ false };
  try {
    app.parse(argc, argv);
    parsed = true;
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
    args.help_requested = true;
  } catch (CLI::ParseError const &e) {
    args.cli_output = e.what();
  }

  // --trace wins over --verbose; both decorate.
  args.verbosity = tui::level::TUI_INFO;
  if (trace_opt->count() > 0) {
    try {
      args.trace_outputs = parse_trace_outputs(trace_spec);
    } catch (std::invalid_argument const &e) {
      args.cli_output = e.what();
      return args;
    }
  }
  if (!args.trace_outputs.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  }

  if (!parsed) { return args; }

  if (show_version) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  auto cfg{ selected.value_or(cmd_run::cfg{}) };
  std::visit(match{ [&](cmd_run::cfg &c) { c.manifest_path = manifest_path; },
                    [&](cmd_list::cfg &c) { c.manifest_path = manifest_path; },
                    [](cmd_version::cfg &) {} },
             cfg);
  args.cmd_cfg = std::move(cfg);
  return args;
}

}  // namespace provision
