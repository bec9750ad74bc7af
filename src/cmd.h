#pragma once

#include "shell.h"
#include "util.h"

#include <memory>

namespace cmdex {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute() = 0;

  // Create command with the globally selected shell (for commands that launch children)
  template <typename config>
  static ptr_t create(config const &cfg, shell_kind shell);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, shell_kind shell) {
  return std::make_unique<typename config::cmd_t>(cfg, shell);
}

}  // namespace cmdex
