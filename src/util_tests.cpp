#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

namespace {

std::filesystem::path temp_file_path(char const *tag) {
  return std::filesystem::temp_directory_path() /
         ("provision-util-test-" + std::string(tag) + ".txt");
}

}  // namespace

TEST_CASE("match dispatches on the active variant alternative") {
  using value_t = std::variant<int, std::string>;
  auto const width{ [](value_t const &v) {
    return std::visit(provision::match{ [](int n) { return n; },
                                        [](std::string const &s) {
                                          return static_cast<int>(s.size());
                                        } },
                      v);
  } };

  CHECK(width(value_t{ 7 }) == 7);
  CHECK(width(value_t{ std::string{ "migrate" } }) == 7);
}

TEST_CASE("util_load_file returns the whole file, binary bytes included") {
  auto const path{ temp_file_path("load") };
  char const raw[]{ "STEPS = {}\n\0\xff tail" };
  std::string const bytes{ raw, sizeof raw - 1 };
  {
    std::ofstream out{ path, std::ios::binary };
    out << bytes;
  }

  CHECK(provision::util_load_file(path) == bytes);

  std::ofstream{ path, std::ios::trunc };
  CHECK(provision::util_load_file(path).empty());

  std::filesystem::remove(path);
}

TEST_CASE("util_load_file names the path it cannot open") {
  auto const path{ temp_file_path("missing") };
  std::filesystem::remove(path);
  CHECK_THROWS_WITH(provision::util_load_file(path),
                    doctest::Contains("cannot open " + path.string()));
}

TEST_CASE("util_open_file returns null for a missing file") {
  CHECK_FALSE(provision::util_open_file("/nonexistent/provision/file", "r"));
}

TEST_CASE("util_flatten_script_with_semicolons handles empty script") {
  CHECK(provision::util_flatten_script_with_semicolons("") == "");
  CHECK(provision::util_flatten_script_with_semicolons("\n\n  \n") == "");
}

TEST_CASE("util_flatten_script_with_semicolons replaces newlines with semicolons") {
  CHECK(provision::util_flatten_script_with_semicolons(
            "pip install -r requirements.txt\npip install --upgrade pip\n") ==
        "pip install -r requirements.txt; pip install --upgrade pip");
}

TEST_CASE("util_flatten_script_with_semicolons handles carriage returns") {
  CHECK(provision::util_flatten_script_with_semicolons("cmd1\rcmd2") == "cmd1; cmd2");
  CHECK(provision::util_flatten_script_with_semicolons("cmd1\r\ncmd2\r\ncmd3") ==
        "cmd1; cmd2; cmd3");
}

TEST_CASE("util_flatten_script_with_semicolons collapses whitespace") {
  CHECK(provision::util_flatten_script_with_semicolons("cmd   arg1 \t arg2") ==
        "cmd arg1 arg2");
  std::string const script{ "  cmd1 arg1  \n\t cmd2  arg2\t\n\n\n  cmd3  " };
  CHECK(provision::util_flatten_script_with_semicolons(script) ==
        "cmd1 arg1; cmd2 arg2; cmd3");
}

TEST_CASE("util_flatten_script_with_semicolons preserves internal semicolons") {
  CHECK(provision::util_flatten_script_with_semicolons("cmd1 ; cmd2\ncmd3;") ==
        "cmd1 ; cmd2; cmd3");
}

TEST_CASE("util_last_nonblank_line") {
  CHECK(provision::util_last_nonblank_line({}).empty());
  CHECK(provision::util_last_nonblank_line({ "", "  ", "\t" }).empty());
  CHECK(provision::util_last_nonblank_line({ "first", "  second  ", " " }) == "second");
}
