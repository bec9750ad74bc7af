#include "cmd_rm.h"

#include "workdir.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace cmdex {

void cmd_rm::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("rm", "Remove files or empty directories") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("paths", cfg_ptr->paths, "Paths to remove")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_rm::cmd_rm(cmd_rm::cfg cfg, shell_kind /*shell*/) : cfg_{ std::move(cfg) } {}

void cmd_rm::execute() {
  working_directory_context const ctx{};
  for (auto const &path : cfg_.paths) { ctx.rm(path); }
}

}  // namespace cmdex
