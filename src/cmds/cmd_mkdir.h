#pragma once

#include "cmd.h"
#include "perm.h"

#include <filesystem>
#include <functional>
#include <string>

namespace CLI { class App; }

namespace cmdex {

class cmd_mkdir : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_mkdir> {
    std::filesystem::path path;
    std::string perm{ "755" };  // owner, group, other digits; missing trailing digits default
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_mkdir(cfg cfg, shell_kind shell);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

// Parses up to three permission digits, e.g. "75" -> {7, 5, 5}.
// Throws permission_encoding_error for non-digits or more than three digits.
perm_triplet cmd_mkdir_parse_perm(std::string const &digits);

}  // namespace cmdex
