#include "util.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace provision {

namespace {

constexpr std::string_view kHorizontalSpace{ " \t" };
constexpr std::string_view kAnySpace{ " \t\r\n" };

std::string_view strip(std::string_view s) {
  auto const first{ s.find_first_not_of(kAnySpace) };
  if (first == std::string_view::npos) { return {}; }
  auto const last{ s.find_last_not_of(kAnySpace) };
  return s.substr(first, last - first + 1);
}

void append_collapsed(std::string &out, std::string_view line) {
  bool in_space{ false };
  for (char const c : line) {
    if (kHorizontalSpace.find(c) != std::string_view::npos) {
      in_space = true;
      continue;
    }
    if (in_space) { out.push_back(' '); }
    in_space = false;
    out.push_back(c);
  }
}

}  // namespace

void file_closer::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_file(std::filesystem::path const &path) {
  auto const file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("cannot open " + path.string() + ": " +
                             std::strerror(errno));
  }

  std::string content;
  std::array<char, 8192> chunk{};
  for (;;) {
    auto const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) };
    content.append(chunk.data(), n);
    if (n < chunk.size()) { break; }
  }

  if (std::ferror(file.get())) { throw std::runtime_error("cannot read " + path.string()); }
  return content;
}

std::string util_flatten_script_with_semicolons(std::string_view script) {
  std::string flat;

  while (!script.empty()) {
    auto const eol{ script.find_first_of("\r\n") };
    auto const line{ strip(script.substr(0, eol)) };
    script = eol == std::string_view::npos ? std::string_view{} : script.substr(eol + 1);

    if (line.empty()) { continue; }
    if (!flat.empty()) { flat.append("; "); }
    append_collapsed(flat, line);
  }

  while (!flat.empty() && (flat.back() == ';' || flat.back() == ' ')) { flat.pop_back(); }
  return flat;
}

std::string util_last_nonblank_line(std::vector<std::string> const &lines) {
  for (auto it{ lines.rbegin() }; it != lines.rend(); ++it) {
    if (auto const line{ strip(*it) }; !line.empty()) { return std::string{ line }; }
  }
  return {};
}

}  // namespace provision
