#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace cmdex {

// Runs a command to completion and prints its captured stdout.
class cmd_exec : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_exec> {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> cwd;
    bool debug{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_exec(cfg cfg, shell_kind shell);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  shell_kind shell_;
};

}  // namespace cmdex
