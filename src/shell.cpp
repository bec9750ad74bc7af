#include "shell.h"

#include <stdexcept>
#include <string>

namespace cmdex {

namespace {

shell_binding bash_binding() { return { .executable = "/bin/bash", .inline_flag = "-c" }; }

shell_binding powershell_binding() {
  return { .executable = "powershell.exe", .inline_flag = "/c" };
}

shell_binding cmd_binding() { return { .executable = "cmd.exe", .inline_flag = "/c" }; }

}  // namespace

shell_binding shell_resolve(shell_kind kind) {
  return shell_resolve(kind, platform::native());
}

shell_binding shell_resolve(shell_kind kind, platform::platform_id host) {
  switch (kind) {
    case shell_kind::powershell: return powershell_binding();
    case shell_kind::cmd: return cmd_binding();
    case shell_kind::bash: return bash_binding();
    case shell_kind::auto_detect:
      if (host == platform::platform_id::WINDOWS) { return powershell_binding(); }
      return bash_binding();
  }
  return bash_binding();
}

shell_kind shell_parse_kind(std::optional<std::string_view> value) {
  if (!value || value->empty() || *value == "auto") { return shell_kind::auto_detect; }
  if (*value == "bash") { return shell_kind::bash; }
  if (*value == "powershell") { return shell_kind::powershell; }
  if (*value == "cmd") { return shell_kind::cmd; }
  throw std::invalid_argument("shell must be one of 'auto', 'bash', 'powershell', 'cmd' (got '" +
                              std::string{ *value } + "')");
}

std::string_view shell_kind_name(shell_kind kind) {
  switch (kind) {
    case shell_kind::auto_detect: return "auto";
    case shell_kind::powershell: return "powershell";
    case shell_kind::cmd: return "cmd";
    case shell_kind::bash: return "bash";
  }
  CMDEX_UNREACHABLE();
}

bool shell_is_windows(shell_binding const &binding) {
  return binding == powershell_binding() || binding == cmd_binding();
}

}  // namespace cmdex
