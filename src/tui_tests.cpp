#include "tui.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace tui = provision::tui;

// Routes log lines into `lines` for the duration of a test. The sink is stopped on entry
// and left stopped, with no trace outputs, on exit.
struct log_capture {
  std::vector<std::string> lines;

  log_capture() {
    tui::set_output_handler([this](std::string_view line) { lines.emplace_back(line); });
  }

  ~log_capture() {
    tui::configure_trace_outputs({});
    tui::set_output_handler(nullptr);
  }
};

std::vector<std::string> read_lines(std::filesystem::path const &path) {
  std::ifstream in{ path };
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) { lines.push_back(line); }
  return lines;
}

}  // namespace

TEST_CASE("tui::init is once per process") {
  CHECK_THROWS_AS(tui::init(), std::logic_error);
}

TEST_CASE_FIXTURE(log_capture, "tui rejects reconfiguration while running") {
  CHECK_THROWS_AS(tui::shutdown(), std::logic_error);

  tui::run();
  CHECK_THROWS_AS(tui::run(), std::logic_error);
  CHECK_THROWS_AS(tui::set_output_handler(nullptr), std::logic_error);
  CHECK_THROWS_AS(tui::configure_trace_outputs({}), std::logic_error);
  tui::shutdown();

  CHECK_THROWS_AS(tui::shutdown(), std::logic_error);
}

TEST_CASE_FIXTURE(log_capture, "tui discards lines logged while stopped") {
  tui::info("before run");
  tui::run();
  tui::info("[%d/%d] %s", 1, 3, "install-dependencies");
  tui::shutdown();
  tui::error("after shutdown");

  CHECK(lines == std::vector<std::string>{ "[1/3] install-dependencies\n" });
}

TEST_CASE_FIXTURE(log_capture, "tui drops messages below the threshold") {
  tui::run(tui::level::TUI_WARN);
  tui::debug("pip freeze");
  tui::info("collecting static assets");
  tui::warn("no STATIC_ROOT");
  tui::error("migration failed");
  tui::shutdown();

  CHECK(lines == std::vector<std::string>{ "no STATIC_ROOT\n", "migration failed\n" });
}

TEST_CASE_FIXTURE(log_capture, "tui keeps every level without a threshold") {
  tui::run(std::nullopt);
  tui::debug("d");
  tui::info("i");
  tui::warn("w");
  tui::error("e");
  tui::shutdown();

  CHECK(lines.size() == 4);
}

TEST_CASE_FIXTURE(log_capture, "tui decorated lines carry a timestamp and level label") {
  tui::run(tui::level::TUI_DEBUG, true);
  tui::debug("resolved %d steps", 3);
  tui::error("boom");
  tui::shutdown();

  REQUIRE(lines.size() == 2);
  // [YYYY-MM-DD HH:MM:SS.mmm] [DBG] resolved 3 steps
  auto const &first{ lines[0] };
  REQUIRE(first.size() > 32);
  CHECK(first[0] == '[');
  CHECK(first[11] == ' ');
  CHECK(first[20] == '.');
  CHECK(first.substr(24, 8) == "] [DBG] ");
  CHECK(first.substr(32) == "resolved 3 steps\n");
  CHECK(lines[1].find("] [ERR] boom\n") != std::string::npos);
}

TEST_CASE_FIXTURE(log_capture, "tui tracing is enabled only while running with outputs") {
  CHECK_FALSE(tui::trace_enabled());

  tui::run();
  CHECK_FALSE(tui::trace_enabled());
  tui::shutdown();

  tui::configure_trace_outputs({ { tui::trace_output_type::std_err, std::nullopt } });
  CHECK_FALSE(tui::trace_enabled());
  tui::run();
  CHECK(tui::trace_enabled());
  tui::shutdown();
  CHECK_FALSE(tui::trace_enabled());
}

TEST_CASE_FIXTURE(log_capture, "tui writes stderr trace events as text lines") {
  tui::configure_trace_outputs({ { tui::trace_output_type::std_err, std::nullopt } });
  tui::run(tui::level::TUI_INFO);
  PROVISION_TRACE_STEP_START("apply-migrations", 3);
  tui::shutdown();

  CHECK(lines == std::vector<std::string>{ "step_start step=apply-migrations position=3\n" });
}

TEST_CASE_FIXTURE(log_capture, "tui writes file trace events as JSON lines") {
  auto const path{ std::filesystem::temp_directory_path() / "provision-tui-trace.jsonl" };
  {
    std::ofstream stale{ path };
    stale << "left over from an earlier run\n";
  }

  tui::configure_trace_outputs({ { tui::trace_output_type::file, path } });
  tui::run();
  PROVISION_TRACE_SEQUENCE_START(2);
  PROVISION_TRACE_STEP_COMPLETE("install-dependencies", 1, 123);
  tui::shutdown();

  CHECK(lines.empty());
  auto const written{ read_lines(path) };
  REQUIRE(written.size() == 2);
  CHECK(written[0].find("\"event\":\"sequence_start\"") != std::string::npos);
  CHECK(written[1].find("\"event\":\"step_complete\"") != std::string::npos);
  CHECK(written[1].find("\"duration_ms\":123") != std::string::npos);

  std::filesystem::remove(path);
}

TEST_CASE_FIXTURE(log_capture, "tui reports an unwritable trace file when starting") {
  tui::configure_trace_outputs(
      { { tui::trace_output_type::file, "/nonexistent/provision/trace.jsonl" } });
  CHECK_THROWS_AS(tui::run(), std::runtime_error);
  CHECK_FALSE(tui::trace_enabled());
}

TEST_CASE_FIXTURE(log_capture, "tui validates trace output specs") {
  auto const dir{ std::filesystem::temp_directory_path() };
  CHECK_THROWS_AS(tui::configure_trace_outputs({ { tui::trace_output_type::file, dir / "a" },
                                                 { tui::trace_output_type::file, dir / "b" } }),
                  std::logic_error);
  CHECK_THROWS_AS(
      tui::configure_trace_outputs({ { tui::trace_output_type::file, std::nullopt } }),
      std::invalid_argument);
}

TEST_CASE_FIXTURE(log_capture, "tui::scope runs the sink for its lifetime") {
  {
    tui::scope const running{ tui::level::TUI_INFO, false };
    tui::info("inside");
  }
  tui::info("outside");

  CHECK(lines == std::vector<std::string>{ "inside\n" });
  CHECK_NOTHROW(tui::run());
  tui::shutdown();
}
