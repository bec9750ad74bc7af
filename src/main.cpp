#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  cmdex::tui::init();

  auto args{ cmdex::cli_parse(argc, argv) };
  cmdex::tui::configure_trace_outputs(args.trace_outputs);
  cmdex::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      cmdex::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    cmdex::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit(
      [shell = args.shell](auto const &cfg) { return cmdex::cmd::create(cfg, shell); },
      *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (std::exception const &ex) {
    cmdex::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
