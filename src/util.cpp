#include "util.h"

#include <cerrno>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace cmdex {

fd_cleanup::~fd_cleanup() {
  if (fd_ == -1) { return; }
  close_with_retry();
}

fd_cleanup &fd_cleanup::operator=(fd_cleanup &&other) noexcept {
  if (this == &other) { return *this; }
  if (fd_ != -1) { close_with_retry(); }
  fd_ = other.fd_;
  other.fd_ = -1;
  return *this;
}

void fd_cleanup::release() {
  if (fd_ == -1) { return; }
  close_with_retry();
  fd_ = -1;
}

void fd_cleanup::close_with_retry() {
  for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
    if (errno != EINTR) { break; }
  }
}

std::string util_join_args(std::string_view command, std::vector<std::string> const &args) {
  std::string result{ command };
  for (auto const &arg : args) {
    result.push_back(' ');
    result.append(arg);
  }
  return result;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace cmdex
