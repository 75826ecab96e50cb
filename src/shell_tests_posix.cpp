#include "shell.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;
using lines_t = std::vector<std::string>;

struct captured {
  provision::shell_result result;
  lines_t out;
  lines_t err;
  lines_t all;
};

captured run_script(std::string_view script, provision::shell_run_cfg cfg = {}) {
  captured c{};
  if (cfg.env.empty()) { cfg.env = provision::shell_getenv(); }
  cfg.on_stdout_line = [&c](std::string_view l) { c.out.emplace_back(l); };
  cfg.on_stderr_line = [&c](std::string_view l) { c.err.emplace_back(l); };
  cfg.on_output_line = [&c](std::string_view l) { c.all.emplace_back(l); };
  c.result = provision::shell_run(script, cfg);
  return c;
}

}  // namespace

TEST_CASE("shell_parse_choice defaults to bash and rejects unknown shells") {
  using provision::shell_choice;
  CHECK(provision::shell_parse_choice(std::nullopt) == shell_choice::bash);
  CHECK(provision::shell_parse_choice("") == shell_choice::bash);
  CHECK(provision::shell_parse_choice("sh") == shell_choice::sh);
  CHECK(provision::shell_choice_name(provision::shell_parse_choice("bash")) == "bash");
  CHECK_THROWS_AS(provision::shell_parse_choice("zsh"), std::invalid_argument);
}

TEST_CASE("shell_getenv reflects the process environment") {
  auto const env{ provision::shell_getenv() };
  REQUIRE(env.count("PATH") == 1);
  CHECK_FALSE(env.at("PATH").empty());
}

TEST_CASE("shell_run runs a multi-line script under either shell") {
  for (auto const shell : { provision::shell_choice::bash, provision::shell_choice::sh }) {
    CAPTURE(provision::shell_choice_name(shell));
    auto const c{ run_script("echo install\necho migrate\n", { .shell = shell }) };
    CHECK(c.result.exit_code == 0);
    CHECK_FALSE(c.result.signal.has_value());
    CHECK(c.out == lines_t{ "install", "migrate" });
  }
}

TEST_CASE("shell_run separates stdout from stderr and merges both in order per stream") {
  auto const c{ run_script("echo o1; echo e1 >&2; echo o2; echo e2 >&2") };
  CHECK(c.out == lines_t{ "o1", "o2" });
  CHECK(c.err == lines_t{ "e1", "e2" });
  REQUIRE(c.all.size() == 4);
}

TEST_CASE("shell_run passes the configured environment") {
  auto env{ provision::shell_getenv() };
  env["DJANGO_SETTINGS_MODULE"] = "app.settings.test";
  auto const c{ run_script("echo \"$DJANGO_SETTINGS_MODULE\"", { .env = env }) };
  CHECK(c.out == lines_t{ "app.settings.test" });
}

TEST_CASE("shell_run runs in the configured directory") {
  auto const dir{ fs::temp_directory_path() };
  auto const c{ run_script("pwd", { .cwd = dir }) };
  REQUIRE(c.out.size() == 1);
  CHECK(fs::weakly_canonical(c.out[0]) == fs::weakly_canonical(dir));
}

TEST_CASE("shell_run exits 127 when the directory does not exist") {
  auto const c{ run_script("echo unreachable", { .cwd = "/nonexistent/provision/cwd" }) };
  CHECK(c.result.exit_code == 127);
  CHECK(c.out.empty());
  CHECK_FALSE(c.err.empty());
}

TEST_CASE("shell_run reports the exit code of a failing script") {
  auto const c{ run_script("echo 'could not connect' >&2; exit 3") };
  CHECK(c.result.exit_code == 3);
  CHECK_FALSE(c.result.signal.has_value());
  CHECK(c.err == lines_t{ "could not connect" });
}

TEST_CASE("shell_run reports a child killed by a signal") {
  auto const c{ run_script("kill -KILL $$") };
  REQUIRE(c.result.signal.has_value());
  CHECK(*c.result.signal == 9);
  CHECK(c.result.exit_code == 128 + 9);
}

TEST_CASE("shell_run in strict mode stops at the first failing command") {
  for (auto const shell : { provision::shell_choice::bash, provision::shell_choice::sh }) {
    CAPTURE(provision::shell_choice_name(shell));
    auto const c{ run_script("echo before\nfalse\necho after", { .shell = shell }) };
    CHECK(c.result.exit_code == 1);
    CHECK(c.out == lines_t{ "before" });
  }
}

TEST_CASE("shell_run without strict mode runs past a failing command") {
  auto const c{ run_script("echo before\nfalse\necho after", { .strict = false }) };
  CHECK(c.result.exit_code == 0);
  CHECK(c.out == lines_t{ "before", "after" });
}

TEST_CASE("shell_run stops at a missing command") {
  auto const c{ run_script("echo before\nno_such_command_provision_42\necho after") };
  CHECK(c.result.exit_code == 127);
  CHECK(c.out == lines_t{ "before" });
  CHECK_FALSE(c.err.empty());
}

TEST_CASE("shell_run keeps heredocs and compound commands intact") {
  auto const c{ run_script("cat <<'DONE'\nalpha  beta\n$NOT_EXPANDED\nDONE\n"
                           "if true; then\n  echo inside\nfi\n") };
  CHECK(c.out == lines_t{ "alpha  beta", "$NOT_EXPANDED", "inside" });
}

TEST_CASE("shell_run delivers a final line without a newline") {
  auto const c{ run_script("printf 'first\\nno-newline'") };
  CHECK(c.out == lines_t{ "first", "no-newline" });
}

TEST_CASE("shell_run with an empty script succeeds silently") {
  auto const c{ run_script("") };
  CHECK(c.result.exit_code == 0);
  CHECK(c.all.empty());
}

TEST_CASE("shell_run streams output larger than a pipe buffer") {
  auto const c{ run_script("i=0; while [ $i -lt 2000 ]; do echo line-$i; i=$((i+1)); done") };
  CHECK(c.result.exit_code == 0);
  REQUIRE(c.out.size() == 2000);
  CHECK(c.out.front() == "line-0");
  CHECK(c.out.back() == "line-1999");
}

TEST_CASE("shell_run lets exceptions from callbacks escape and reaps the child") {
  provision::shell_run_cfg cfg{
    .on_output_line = [](std::string_view) { throw std::runtime_error{ "stop" }; },
    .env = provision::shell_getenv(),
  };
  CHECK_THROWS_WITH_AS(provision::shell_run("echo hi; sleep 30", cfg),
                       "stop",
                       std::runtime_error);
}
