#include "cmd_clear.h"

#include "exec.h"

#include "CLI11.hpp"

#include <utility>

namespace cmdex {

void cmd_clear::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("clear", "Clear the terminal") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_clear::cmd_clear(cmd_clear::cfg cfg, shell_kind shell)
    : cfg_{ std::move(cfg) }, shell_{ shell } {}

void cmd_clear::execute() { executor{ shell_ }.clear_console(); }

}  // namespace cmdex
