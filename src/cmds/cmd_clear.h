#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace cmdex {

class cmd_clear : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_clear> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_clear(cfg cfg, shell_kind shell);

  void execute() override;

 private:
  cfg cfg_;
  shell_kind shell_;
};

}  // namespace cmdex
