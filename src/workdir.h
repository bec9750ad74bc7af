#pragma once

#include "perm.h"

#include <filesystem>

namespace cmdex {

// Thin wrappers over the process-wide working directory. Each operation is one OS
// call and throws directory_op_error on failure.
//
// Calls through any working_directory_context are serialized with a process-wide
// mutex. Other code that relies on the current directory (relative paths, child
// processes launched without an explicit cwd) must serialize with cd() itself.
class working_directory_context {
 public:
  // Permissions are subject to the process umask, as with mkdir(2).
  void mkdir(std::filesystem::path const &name, perm_triplet perms = {}) const;
  void mkdir_and_cd(std::filesystem::path const &name, perm_triplet perms = {}) const;
  void cd(std::filesystem::path const &path) const;

  // Removes a file or an empty directory.
  void rm(std::filesystem::path const &path) const;

  std::filesystem::path current() const;
};

}  // namespace cmdex
