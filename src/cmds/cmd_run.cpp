#include "cmd_run.h"

#include "exec.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace cmdex {

void cmd_run::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("run", "Run a command, streaming its output by line") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("command", cfg_ptr->command, "Inline command for the shell")->required();
  sub->add_option("args", cfg_ptr->args, "Positional arguments passed after the command");
  sub->add_option("--cwd", cfg_ptr->cwd, "Working directory for the command")
      ->check(CLI::ExistingDirectory);
  sub->add_flag("--debug",
                cfg_ptr->debug,
                "Inherit stdin and mirror the command's stderr");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_run::cmd_run(cmd_run::cfg cfg, shell_kind shell)
    : cfg_{ std::move(cfg) }, shell_{ shell } {}

void cmd_run::execute() {
  executor exec{ shell_ };
  exec.set_debug(cfg_.debug);
  exec.set_working_directory(cfg_.cwd);

  auto execution{ exec.async_execute(cfg_.command, cfg_.args) };

  // Keep draining after a failure so the channel closes normally.
  std::optional<std::pair<exec_fault, bool>> failure;
  for (auto const &ev : execution) {
    if (ev.is_line()) {
      // Debug mode already mirrored the raw stderr bytes.
      if (ev.is_stderr && cfg_.debug) { continue; }
      std::string text{ ev.line };
      text.push_back('\n');
      if (ev.is_stderr) {
        tui::print_stderr(text);
      } else {
        tui::print_stdout(text);
      }
      continue;
    }

    if (ev.fault->end_of_stream()) {
      tui::debug("%s", ev.fault->message.c_str());
      continue;
    }

    tui::debug("fault: %s", ev.fault->message.c_str());
    if (!failure) { failure.emplace(*ev.fault, ev.is_stderr); }
  }

  if (failure) { failure->first.raise(failure->second); }
}

}  // namespace cmdex
