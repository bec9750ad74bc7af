#include "cmd_version.h"

#include "platform.h"
#include "shell.h"
#include "tui.h"

#include "CLI11.hpp"

#include <string>
#include <utility>

#ifndef CMDEX_VERSION_STR
#error "CMDEX_VERSION_STR must be defined by the build system"
#endif

namespace cmdex {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, shell_kind shell)
    : cfg_{ std::move(cfg) }, shell_{ shell } {}

void cmd_version::execute() {
  shell_binding const binding{ shell_resolve(shell_) };

  tui::info("cmdex version %s", CMDEX_VERSION_STR);
  tui::info("  platform: %s/%s",
            std::string{ platform::os_name() }.c_str(),
            std::string{ platform::arch_name() }.c_str());
  tui::info("  shell: %s (%s %s)",
            std::string{ shell_kind_name(shell_) }.c_str(),
            binding.executable.c_str(),
            binding.inline_flag.c_str());
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace cmdex
