#include "step_catalog.h"

#include "sequencer.h"

#include "doctest/doctest.h"

#include <string>
#include <vector>

namespace {

std::vector<std::string> active_names(provision::step_catalog const &catalog) {
  std::vector<std::string> names;
  for (auto const *entry : provision::step_catalog_active(catalog)) {
    names.push_back(entry->name);
  }
  return names;
}

provision::step_action noop_action(provision::catalog_entry const &) {
  return [] { return provision::step_result::success(); };
}

}  // namespace

TEST_CASE("default catalog lists every known step in canonical order") {
  auto const catalog{ provision::step_catalog_default() };

  REQUIRE(catalog.entries.size() == 4);
  CHECK(catalog.entries[0].name == "install-dependencies");
  CHECK(catalog.entries[1].name == "collect-static-assets");
  CHECK(catalog.entries[2].name == "create-admin-user");
  CHECK(catalog.entries[3].name == "apply-migrations");
  CHECK_FALSE(catalog.entries[2].enabled);
  CHECK_FALSE(catalog.sequence.has_value());
  CHECK(catalog.shell == provision::shell_choice::bash);
}

TEST_CASE("default catalog active sequence skips the disabled admin step") {
  CHECK(active_names(provision::step_catalog_default()) ==
        std::vector<std::string>{ "install-dependencies",
                                  "collect-static-assets",
                                  "apply-migrations" });
}

TEST_CASE("default catalog install step upgrades the installer after installing") {
  auto const catalog{ provision::step_catalog_default() };
  auto const *install{ provision::step_catalog_find(catalog, "install-dependencies") };
  REQUIRE(install != nullptr);
  auto const first{ install->script.find("pip install -r requirements.txt") };
  auto const second{ install->script.find("pip install --upgrade pip") };
  REQUIRE(first != std::string::npos);
  REQUIRE(second != std::string::npos);
  CHECK(first < second);
}

TEST_CASE("step_catalog_find") {
  auto const catalog{ provision::step_catalog_default() };
  CHECK(provision::step_catalog_find(catalog, "apply-migrations") == &catalog.entries[3]);
  CHECK(provision::step_catalog_find(catalog, "seed-data") == nullptr);
}

TEST_CASE("explicit sequence selects and orders entries") {
  auto catalog{ provision::step_catalog_default() };
  catalog.sequence = std::vector<std::string>{ "apply-migrations", "install-dependencies" };

  CHECK(active_names(catalog) ==
        std::vector<std::string>{ "apply-migrations", "install-dependencies" });
}

TEST_CASE("explicit sequence naming an unknown step is a configuration error") {
  auto catalog{ provision::step_catalog_default() };
  catalog.sequence = std::vector<std::string>{ "install-dependencies", "seed-data" };
  CHECK_THROWS_AS(provision::step_catalog_active(catalog), provision::configuration_error);
}

TEST_CASE("explicit sequence naming a disabled step is a configuration error") {
  auto catalog{ provision::step_catalog_default() };
  catalog.sequence = std::vector<std::string>{ "create-admin-user" };
  CHECK_THROWS_AS(provision::step_catalog_active(catalog), provision::configuration_error);
}

TEST_CASE("enabling the admin step places it before migrations") {
  auto catalog{ provision::step_catalog_default() };
  catalog.entries[2].enabled = true;

  CHECK(active_names(catalog) == std::vector<std::string>{ "install-dependencies",
                                                           "collect-static-assets",
                                                           "create-admin-user",
                                                           "apply-migrations" });
}

TEST_CASE("step_catalog_validate rejects malformed entries") {
  provision::step_catalog catalog;

  SUBCASE("blank name") {
    catalog.entries.push_back({ .name = "  ", .script = "true" });
  }

  SUBCASE("blank script") {
    catalog.entries.push_back({ .name = "a", .script = " \n\t" });
  }

  SUBCASE("duplicate names") {
    catalog.entries.push_back({ .name = "a", .script = "true" });
    catalog.entries.push_back({ .name = "a", .script = "false" });
  }

  CHECK_THROWS_AS(provision::step_catalog_validate(catalog),
                  provision::configuration_error);
}

TEST_CASE("step_catalog_build_steps makes one required step per active entry") {
  auto const catalog{ provision::step_catalog_default() };

  std::vector<std::string> built_for;
  auto const steps{ provision::step_catalog_build_steps(
      catalog,
      [&](provision::catalog_entry const &entry) {
        built_for.push_back(entry.name);
        return noop_action(entry);
      }) };

  REQUIRE(steps.size() == 3);
  CHECK(built_for == std::vector<std::string>{ "install-dependencies",
                                               "collect-static-assets",
                                               "apply-migrations" });
  for (auto const &s : steps) {
    CHECK(s.required);
    CHECK(static_cast<bool>(s.action));
  }
  CHECK(provision::outcome_completed_ok(provision::sequencer_run(steps)));
}

TEST_CASE("empty catalog yields an empty sequence the sequencer rejects") {
  provision::step_catalog const catalog;
  auto const steps{ provision::step_catalog_build_steps(catalog, noop_action) };
  CHECK(steps.empty());
  CHECK_THROWS_AS(provision::sequencer_run(steps), provision::configuration_error);
}
