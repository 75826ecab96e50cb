#include "shell.h"

#include <stdexcept>

namespace provision {

std::string_view shell_choice_name(shell_choice choice) {
  switch (choice) {
    case shell_choice::bash: return "bash";
    case shell_choice::sh: return "sh";
  }
  return "unknown";
}

shell_choice shell_parse_choice(std::optional<std::string_view> value) {
  if (!value || value->empty()) { return shell_choice::bash; }
  if (*value == "bash") { return shell_choice::bash; }
  if (*value == "sh") { return shell_choice::sh; }
  throw std::invalid_argument("shell option must be 'bash' or 'sh'");
}

}  // namespace provision
