#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace provision {

// Base for types whose identity matters (commands, the loaded manifest).
struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

// Overload set for std::visit.
template <typename... Fs>
struct match : Fs... {
  using Fs::operator()...;
};
template <typename... Fs>
match(Fs...) -> match<Fs...>;

struct file_closer {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_closer>;

// nullptr when fopen fails; errno is left as fopen set it.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Whole file as text. Throws std::runtime_error naming the path on any I/O failure.
std::string util_load_file(std::filesystem::path const &path);

// One-line rendering of a script for logs and listings: each non-blank line trimmed,
// runs of spaces and tabs collapsed, lines joined with "; ", trailing ';' dropped.
std::string util_flatten_script_with_semicolons(std::string_view script);

std::string util_last_nonblank_line(std::vector<std::string> const &lines);

}  // namespace provision
