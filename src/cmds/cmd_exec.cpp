#include "cmd_exec.h"

#include "errors.h"
#include "exec.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <string>
#include <utility>

namespace cmdex {

void cmd_exec::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("exec", "Run a command to completion and print its output") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("command", cfg_ptr->command, "Inline command for the shell")->required();
  sub->add_option("args", cfg_ptr->args, "Positional arguments passed after the command");
  sub->add_option("--cwd", cfg_ptr->cwd, "Working directory for the command")
      ->check(CLI::ExistingDirectory);
  sub->add_flag("--debug", cfg_ptr->debug, "Inherit stdin and pass stderr through");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_exec::cmd_exec(cmd_exec::cfg cfg, shell_kind shell)
    : cfg_{ std::move(cfg) }, shell_{ shell } {}

void cmd_exec::execute() {
  executor exec{ shell_ };
  exec.set_debug(cfg_.debug);
  exec.set_working_directory(cfg_.cwd);

  try {
    std::string const output{ exec.execute(cfg_.command, cfg_.args) };
    tui::print_stdout(output);
  } catch (process_wait_error const &ex) {
    tui::print_stdout(ex.output());
    tui::print_stderr(ex.error_output());
    throw;
  }
}

}  // namespace cmdex
