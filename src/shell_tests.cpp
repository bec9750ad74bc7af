#include "shell.h"

#include "doctest.h"

#include <optional>
#include <stdexcept>
#include <string_view>

TEST_CASE("shell_resolve maps explicit kinds to fixed bindings") {
  auto const bash{ cmdex::shell_resolve(cmdex::shell_kind::bash) };
  CHECK(bash.executable == "/bin/bash");
  CHECK(bash.inline_flag == "-c");

  auto const ps{ cmdex::shell_resolve(cmdex::shell_kind::powershell) };
  CHECK(ps.executable == "powershell.exe");
  CHECK(ps.inline_flag == "/c");

  auto const cmd{ cmdex::shell_resolve(cmdex::shell_kind::cmd) };
  CHECK(cmd.executable == "cmd.exe");
  CHECK(cmd.inline_flag == "/c");
}

TEST_CASE("shell_resolve auto_detect follows the host platform") {
  using cmdex::platform::platform_id;

  CHECK(cmdex::shell_resolve(cmdex::shell_kind::auto_detect, platform_id::WINDOWS) ==
        cmdex::shell_resolve(cmdex::shell_kind::powershell));
  CHECK(cmdex::shell_resolve(cmdex::shell_kind::auto_detect, platform_id::POSIX) ==
        cmdex::shell_resolve(cmdex::shell_kind::bash));
  CHECK(cmdex::shell_resolve(cmdex::shell_kind::auto_detect, platform_id::UNKNOWN) ==
        cmdex::shell_resolve(cmdex::shell_kind::bash));

  // Explicit kinds ignore the host.
  CHECK(cmdex::shell_resolve(cmdex::shell_kind::cmd, platform_id::POSIX).executable ==
        "cmd.exe");
}

TEST_CASE("shell_resolve auto_detect is stable") {
  auto const first{ cmdex::shell_resolve(cmdex::shell_kind::auto_detect) };
  auto const second{ cmdex::shell_resolve(cmdex::shell_kind::auto_detect) };
  CHECK(first == second);
#if !defined(_WIN32)
  CHECK(first.executable == "/bin/bash");
#endif
}

TEST_CASE("shell_parse_kind accepts known names") {
  CHECK(cmdex::shell_parse_kind(std::nullopt) == cmdex::shell_kind::auto_detect);
  CHECK(cmdex::shell_parse_kind(std::string_view{}) == cmdex::shell_kind::auto_detect);
  CHECK(cmdex::shell_parse_kind("auto") == cmdex::shell_kind::auto_detect);
  CHECK(cmdex::shell_parse_kind("bash") == cmdex::shell_kind::bash);
  CHECK(cmdex::shell_parse_kind("powershell") == cmdex::shell_kind::powershell);
  CHECK(cmdex::shell_parse_kind("cmd") == cmdex::shell_kind::cmd);
}

TEST_CASE("shell_parse_kind rejects unknown names") {
  CHECK_THROWS_AS(cmdex::shell_parse_kind("zsh"), std::invalid_argument);
  CHECK_THROWS_AS(cmdex::shell_parse_kind("Bash"), std::invalid_argument);
}

TEST_CASE("shell_kind_name round-trips through shell_parse_kind") {
  for (auto const kind : { cmdex::shell_kind::auto_detect,
                           cmdex::shell_kind::bash,
                           cmdex::shell_kind::powershell,
                           cmdex::shell_kind::cmd }) {
    CHECK(cmdex::shell_parse_kind(cmdex::shell_kind_name(kind)) == kind);
  }
}

TEST_CASE("shell_is_windows identifies Windows bindings") {
  CHECK(cmdex::shell_is_windows(cmdex::shell_resolve(cmdex::shell_kind::powershell)));
  CHECK(cmdex::shell_is_windows(cmdex::shell_resolve(cmdex::shell_kind::cmd)));
  CHECK_FALSE(cmdex::shell_is_windows(cmdex::shell_resolve(cmdex::shell_kind::bash)));
}
