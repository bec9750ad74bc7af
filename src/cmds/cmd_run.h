#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace cmdex {

// Streams a command's output line by line as it is produced.
class cmd_run : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_run> {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> cwd;
    bool debug{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_run(cfg cfg, shell_kind shell);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  shell_kind shell_;
};

}  // namespace cmdex
