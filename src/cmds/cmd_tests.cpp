#include "cmd.h"
#include "cmd_list.h"
#include "cmd_run.h"

#include "sequencer.h"
#include "step_catalog.h"

#include "doctest/doctest.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <type_traits>

namespace {

namespace fs = std::filesystem;

class test_cmd : public provision::cmd {
 public:
  struct cfg : provision::cmd_cfg<test_cmd> {
    bool result{ true };
  };
  explicit test_cmd(cfg cfg) : cfg_{ cfg } {}
  bool execute() override { return cfg_.result; }

 private:
  cfg cfg_;
};

fs::path make_temp_dir(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id{ counter.fetch_add(1, std::memory_order_relaxed) };
  auto const dir{ fs::temp_directory_path() /
                  ("provision-cmd-test-" + std::string(tag) + "-" + std::to_string(id)) };
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

fs::path write_manifest(fs::path const &dir, std::string const &content) {
  auto const path{ dir / "provision.lua" };
  std::ofstream out{ path };
  out << content;
  return path;
}

std::string read_file(fs::path const &path) {
  std::ifstream in{ path };
  return { std::istreambuf_iterator<char>{ in }, {} };
}

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  CHECK(std::is_same_v<test_cmd::cfg::cmd_t, test_cmd>);
  CHECK(std::is_same_v<provision::cmd_run::cfg::cmd_t, provision::cmd_run>);
  CHECK(std::is_same_v<provision::cmd_list::cfg::cmd_t, provision::cmd_list>);
}

TEST_CASE("cmd factory creates command from cfg") {
  auto ok{ provision::cmd::create(test_cmd::cfg{}) };
  REQUIRE(ok);
  CHECK(ok->execute());

  test_cmd::cfg failing{};
  failing.result = false;
  CHECK_FALSE(provision::cmd::create(failing)->execute());
}

TEST_CASE("cmd_run executes manifest steps in order from the manifest directory") {
  auto const root{ make_temp_dir("run-ok") };
  auto const manifest{ write_manifest(root, R"lua(
STEPS = {
  { name = "first", run = "echo first >> order.log" },
  { name = "skipped", run = "echo skipped >> order.log", enabled = false },
  { name = "second", run = "echo second >> order.log" },
}
)lua") };

  provision::cmd_run::cfg cfg{};
  cfg.manifest_path = manifest;
  auto cmd{ provision::cmd::create(cfg) };

  CHECK(cmd->execute());
  CHECK(read_file(root / "order.log") == "first\nsecond\n");

  fs::remove_all(root);
}

TEST_CASE("cmd_run stops at the first failing step and reports failure") {
  auto const root{ make_temp_dir("run-fail") };
  auto const manifest{ write_manifest(root, R"lua(
STEPS = {
  { name = "install", run = "echo install >> order.log" },
  { name = "assets", run = "echo 'no space left' >&2; exit 1" },
  { name = "migrate", run = "echo migrate >> order.log" },
}
)lua") };

  provision::cmd_run::cfg cfg{};
  cfg.manifest_path = manifest;

  CHECK_FALSE(provision::cmd::create(cfg)->execute());
  CHECK(read_file(root / "order.log") == "install\n");

  fs::remove_all(root);
}

TEST_CASE("cmd_run surfaces configuration errors before running any step") {
  auto const root{ make_temp_dir("run-config") };
  auto const manifest{ write_manifest(root, R"lua(
STEPS = { { name = "install", run = "echo install >> order.log" } }
SEQUENCE = { "install", "seed" }
)lua") };

  provision::cmd_run::cfg cfg{};
  cfg.manifest_path = manifest;

  CHECK_THROWS_AS(provision::cmd::create(cfg)->execute(), provision::configuration_error);
  CHECK_FALSE(fs::exists(root / "order.log"));

  fs::remove_all(root);
}

TEST_CASE("cmd_run rejects a missing explicit manifest") {
  provision::cmd_run::cfg cfg{};
  cfg.manifest_path = fs::path{ "/nonexistent/provision/provision.lua" };
  CHECK_THROWS_AS(provision::cmd::create(cfg)->execute(), provision::configuration_error);
}

TEST_CASE("cmd_list_format numbers active steps and marks excluded ones") {
  auto const text{ provision::cmd_list_format(provision::step_catalog_default()) };

  CHECK(text ==
        "1. install-dependencies   enabled   pip install -r requirements.txt; pip "
        "install --upgrade pip\n"
        "2. collect-static-assets  enabled   python manage.py collectstatic --no-input\n"
        " - create-admin-user      disabled  python manage.py initadmin\n"
        "3. apply-migrations       enabled   python manage.py migrate\n");
}

TEST_CASE("cmd_list_format follows an explicit sequence") {
  auto catalog{ provision::step_catalog_default() };
  catalog.sequence = std::vector<std::string>{ "apply-migrations" };

  auto const text{ provision::cmd_list_format(catalog) };
  CHECK(text.find("1. apply-migrations") != std::string::npos);
  CHECK(text.find(" - install-dependencies") != std::string::npos);
  CHECK(text.find(" - collect-static-assets") != std::string::npos);
}
