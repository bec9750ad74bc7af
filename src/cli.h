#pragma once

#include "cmds/cmd_clear.h"
#include "cmds/cmd_exec.h"
#include "cmds/cmd_mkdir.h"
#include "cmds/cmd_rm.h"
#include "cmds/cmd_run.h"
#include "cmds/cmd_version.h"
#include "shell.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cmdex {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_clear::cfg,
                                 cmd_exec::cfg,
                                 cmd_mkdir::cfg,
                                 cmd_rm::cfg,
                                 cmd_run::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  shell_kind shell{ shell_kind::auto_detect };  // --shell, else CMDEX_SHELL
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace cmdex
