#pragma once

#include "platform.h"

#include <optional>
#include <string>
#include <string_view>

namespace cmdex {

enum class shell_kind { auto_detect, powershell, cmd, bash };

// Executable plus the flag that makes it run one inline command string.
struct shell_binding {
  std::string executable;
  std::string inline_flag;

  bool operator==(shell_binding const &) const = default;
};

// Never fails: auto_detect picks PowerShell on Windows and Bash everywhere else.
shell_binding shell_resolve(shell_kind kind);
shell_binding shell_resolve(shell_kind kind, platform::platform_id host);

// Accepts "auto", "bash", "powershell", "cmd"; nullopt or empty means auto.
// Throws std::invalid_argument for anything else.
shell_kind shell_parse_kind(std::optional<std::string_view> value);
std::string_view shell_kind_name(shell_kind kind);

bool shell_is_windows(shell_binding const &binding);

}  // namespace cmdex
