#pragma once

#include "errors.h"
#include "process.h"
#include "shell.h"
#include "util.h"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cmdex {

enum class fault_kind { stream_read, process_wait };

// Terminal condition delivered in-band on an async execution's event stream.
struct exec_fault {
  fault_kind kind;
  std::error_code code;  // errno of a failed read; empty for end-of-stream and exit status
  std::string message;
  std::optional<exit_status> status;  // set when the child was reaped

  bool end_of_stream() const { return kind == fault_kind::stream_read && !code; }

  // Throws stream_read_error or process_wait_error.
  [[noreturn]] void raise(bool is_stderr) const;
};

struct output_event {
  std::string line;
  std::optional<exec_fault> fault;
  bool is_stderr{ false };

  bool is_line() const { return !fault.has_value(); }
};

// One running command whose stdout and stderr are decoded into line events.
//
// Each stream gets its own reader thread that sends line events in the order the
// lines end in that stream, then exactly one terminal fault (end_of_stream, a
// read error, or operation_canceled after cancel()). A coordinator thread waits for the child, sends one process_wait
// fault if it did not exit cleanly, joins both readers, and only then closes the
// channel. Nothing is ordered between the two streams.
//
// Drain with next() (or range-for) until it returns nullopt. Destroying the object
// before that point abandons the command: the child is killed and remaining events
// are discarded. A moved-from execution behaves as finished and empty.
class async_execution : uncopyable {
 public:
  static constexpr std::size_t kChannelCapacity{ 10 };

  class iterator {
   public:
    using value_type = output_event;
    using difference_type = std::ptrdiff_t;

    iterator() = default;
    explicit iterator(async_execution *owner);

    output_event const &operator*() const { return *current_; }
    output_event const *operator->() const { return &*current_; }
    iterator &operator++();
    void operator++(int) { ++*this; }
    bool operator==(std::default_sentinel_t) const { return !current_.has_value(); }

   private:
    async_execution *owner_{ nullptr };
    std::optional<output_event> current_;
  };

  async_execution(async_execution &&) noexcept;
  async_execution &operator=(async_execution &&) = delete;
  ~async_execution();

  // Blocks for the next event; nullopt once the channel is closed and drained.
  std::optional<output_event> next();

  // Kills the child's process group and ends both streams with an
  // operation_canceled fault, even if a background job still holds the pipes.
  // The channel then closes through the normal path.
  void cancel();

  pid_t pid() const;  // -1 once moved from
  bool finished() const;

  iterator begin() { return iterator{ this }; }
  std::default_sentinel_t end() const { return {}; }

 private:
  struct session;
  explicit async_execution(std::unique_ptr<session> state);

  friend class executor;

  std::unique_ptr<session> state_;
};

class executor {
 public:
  explicit executor(shell_kind kind = shell_kind::auto_detect);
  explicit executor(shell_binding binding);

  shell_binding const &binding() const { return binding_; }

  // Debug mode hands the caller's stdin to the child and mirrors child stderr to
  // the caller's stderr.
  void set_debug(bool enabled) { debug_ = enabled; }
  bool debug() const { return debug_; }

  void set_working_directory(std::optional<std::filesystem::path> cwd) {
    cwd_ = std::move(cwd);
  }
  std::optional<std::filesystem::path> const &working_directory() const { return cwd_; }

  // Runs to completion and returns stdout verbatim. Throws launch_error, or
  // process_wait_error (carrying the output) when the child fails.
  std::string execute(std::string_view command,
                      std::vector<std::string> const &extra_args = {}) const;

  // Throws launch_error if the child cannot be started; every later failure is
  // reported as an event.
  async_execution async_execute(std::string_view command,
                                std::vector<std::string> extra_args = {}) const;

  void clear_console() const;

 private:
  shell_binding binding_;
  bool debug_{ false };
  std::optional<std::filesystem::path> cwd_;
};

}  // namespace cmdex
