#include "platform.h"

#ifdef __APPLE__
#include <mach-o/dyld.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#endif

namespace provision::platform {

#ifdef __APPLE__
std::filesystem::path get_exe_path() {
  std::uint32_t len{ 0 };
  _NSGetExecutablePath(nullptr, &len);

  std::string raw(len, '\0');
  if (_NSGetExecutablePath(raw.data(), &len) != 0) {
    throw std::runtime_error("cannot determine executable path");
  }
  raw.resize(raw.find('\0'));
  return std::filesystem::canonical(raw);
}
#else
// read_symlink throws std::filesystem::filesystem_error on failure.
std::filesystem::path get_exe_path() {
  return std::filesystem::read_symlink("/proc/self/exe");
}
#endif

}  // namespace provision::platform
