#pragma once

#include <filesystem>

namespace provision::platform {

// Absolute path of the running binary. Throws if the OS cannot report it.
std::filesystem::path get_exe_path();

}  // namespace provision::platform
