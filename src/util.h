#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cmdex {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable const &) = delete;
  uncopyable &operator=(uncopyable const &) = delete;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Owns a POSIX file descriptor; closes it (retrying on EINTR) on destruction.
class fd_cleanup {
 public:
  fd_cleanup() = default;
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup();

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }
  fd_cleanup &operator=(fd_cleanup &&other) noexcept;

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ != -1; }

  void release();

 private:
  void close_with_retry();

  int fd_{ -1 };
};

// Join arguments with single spaces for display (no quoting).
std::string util_join_args(std::string_view command, std::vector<std::string> const &args);

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace cmdex
