#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <vector>

namespace CLI { class App; }

namespace cmdex {

class cmd_rm : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_rm> {
    std::vector<std::filesystem::path> paths;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_rm(cfg cfg, shell_kind shell);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace cmdex
