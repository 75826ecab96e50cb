#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace provision {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
};

enum class shell_choice { bash, sh };

enum class shell_stream { std_out, std_err };

struct shell_run_cfg {
  std::function<void(std::string_view)> on_output_line;
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
  shell_choice shell{ shell_choice::bash };
  bool strict{ true };  // run the shell with -e
};

std::string_view shell_choice_name(shell_choice choice);
shell_choice shell_parse_choice(std::optional<std::string_view> value);

shell_env_t shell_getenv();

// Runs the script in a child shell, blocking until it exits. Output is delivered one
// line at a time to the callbacks. Throws std::system_error if the child cannot be
// spawned; a child that cannot chdir or exec exits with 127.
shell_result shell_run(std::string_view script, shell_run_cfg const &cfg);

}  // namespace provision
