#include "cmd_mkdir.h"

#include "errors.h"
#include "tui.h"
#include "workdir.h"

#include "CLI11.hpp"

#include <array>
#include <memory>
#include <tuple>
#include <utility>

namespace cmdex {

void cmd_mkdir::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("mkdir", "Create a directory with explicit permissions") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("path", cfg_ptr->path, "Directory to create")->required();
  sub->add_option("--perm", cfg_ptr->perm, "Permission digits (owner, group, other)")
      ->capture_default_str();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

perm_triplet cmd_mkdir_parse_perm(std::string const &digits) {
  if (digits.size() > 3) {
    throw permission_encoding_error("too many permission digits: " + digits);
  }

  perm_triplet perms{};
  std::array<perm_mode *, 3> const slots{ &perms.owner, &perms.group, &perms.other };
  for (size_t i{ 0 }; i < digits.size(); ++i) {
    char const c{ digits[i] };
    if (c < '0' || c > '9') {
      throw permission_encoding_error("not a permission digit: " + digits);
    }
    *slots[i] = static_cast<perm_mode>(c - '0');
  }

  std::ignore = merge_perm(perms);  // rejects digits above 7
  return perms;
}

cmd_mkdir::cmd_mkdir(cmd_mkdir::cfg cfg, shell_kind /*shell*/) : cfg_{ std::move(cfg) } {}

void cmd_mkdir::execute() {
  perm_triplet const perms{ cmd_mkdir_parse_perm(cfg_.perm) };
  working_directory_context{}.mkdir(cfg_.path, perms);
  tui::info("created %s", cfg_.path.string().c_str());
}

}  // namespace cmdex
