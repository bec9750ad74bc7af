#include "workdir.h"

#include "errors.h"
#include "tui.h"

#include <cerrno>
#include <cstdio>
#include <mutex>
#include <string>
#include <system_error>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace cmdex {

namespace {

std::mutex &cwd_mutex() {
  static std::mutex m;
  return m;
}

[[noreturn]] void throw_op_error(char const *op, std::filesystem::path const &path) {
  std::error_code const ec{ errno, std::generic_category() };
  tui::debug("%s %s failed: %s", op, path.string().c_str(), ec.message().c_str());
  throw directory_op_error(ec, std::string{ op } + " " + path.string(), path);
}

void mkdir_locked(std::filesystem::path const &name, perm_triplet perms) {
  auto const mode{ static_cast<mode_t>(perm_to_fs(merge_perm(perms))) };
  if (::mkdir(name.c_str(), mode) == -1) { throw_op_error("mkdir", name); }
  tui::debug("mkdir %s (%03o)", name.string().c_str(), static_cast<unsigned>(mode));
}

void cd_locked(std::filesystem::path const &path) {
  if (::chdir(path.c_str()) == -1) { throw_op_error("cd", path); }
  tui::debug("cd %s", path.string().c_str());
}

}  // namespace

void working_directory_context::mkdir(std::filesystem::path const &name,
                                      perm_triplet perms) const {
  std::lock_guard<std::mutex> lock{ cwd_mutex() };
  mkdir_locked(name, perms);
}

void working_directory_context::mkdir_and_cd(std::filesystem::path const &name,
                                             perm_triplet perms) const {
  std::lock_guard<std::mutex> lock{ cwd_mutex() };
  mkdir_locked(name, perms);
  cd_locked(name);
}

void working_directory_context::cd(std::filesystem::path const &path) const {
  std::lock_guard<std::mutex> lock{ cwd_mutex() };
  cd_locked(path);
}

void working_directory_context::rm(std::filesystem::path const &path) const {
  std::lock_guard<std::mutex> lock{ cwd_mutex() };
  if (std::remove(path.c_str()) != 0) { throw_op_error("rm", path); }
  tui::debug("rm %s", path.string().c_str());
}

std::filesystem::path working_directory_context::current() const {
  std::lock_guard<std::mutex> lock{ cwd_mutex() };
  std::error_code ec;
  auto cwd{ std::filesystem::current_path(ec) };
  if (ec) { throw directory_op_error(ec, "getcwd failed", {}); }
  return cwd;
}

}  // namespace cmdex
