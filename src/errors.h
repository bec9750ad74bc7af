#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace cmdex {

struct exit_status {
  int exit_code;
  std::optional<int> signal;

  bool success() const { return exit_code == 0 && !signal; }
};

std::string exit_status_describe(exit_status const &status);

// The child could not be started. Thrown before any output stream exists.
class launch_error : public std::system_error {
 public:
  launch_error(std::error_code ec, std::string const &what)
      : std::system_error{ ec, what } {}
};

// A decode path could not read from its pipe.
class stream_read_error : public std::system_error {
 public:
  stream_read_error(std::error_code ec, std::string const &what, bool is_stderr)
      : std::system_error{ ec, what }, is_stderr_{ is_stderr } {}

  bool is_stderr() const { return is_stderr_; }

 private:
  bool is_stderr_;
};

// The child exited unsuccessfully, or waiting on it failed.
class process_wait_error : public std::runtime_error {
 public:
  process_wait_error(std::string const &what,
                     std::optional<exit_status> status,
                     std::string output = {},
                     std::string error_output = {})
      : std::runtime_error{ what },
        status_{ status },
        output_{ std::move(output) },
        error_output_{ std::move(error_output) } {}

  std::optional<exit_status> const &status() const { return status_; }
  std::string const &output() const { return output_; }
  std::string const &error_output() const { return error_output_; }

 private:
  std::optional<exit_status> status_;
  std::string output_;
  std::string error_output_;
};

class directory_op_error : public std::system_error {
 public:
  directory_op_error(std::error_code ec, std::string const &what, std::filesystem::path p)
      : std::system_error{ ec, what }, path_{ std::move(p) } {}

  std::filesystem::path const &path() const { return path_; }

 private:
  std::filesystem::path path_;
};

class permission_encoding_error : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace cmdex
