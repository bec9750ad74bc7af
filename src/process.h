#pragma once

#include "errors.h"
#include "shell.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace cmdex {

enum class stdio_mode { pipe, inherit, null };

enum class output_stream { std_out, std_err };

std::string_view output_stream_name(output_stream stream);

struct launch_cfg {  // stdin accepts null or inherit only
  stdio_mode std_in{ stdio_mode::null };
  stdio_mode std_out{ stdio_mode::pipe };
  stdio_mode std_err{ stdio_mode::pipe };
  std::optional<std::filesystem::path> cwd;
};

// A spawned child. The child leads its own process group so terminate() also
// reaches grandchildren that inherited the output pipes.
//
// wait() and terminate() may run concurrently from different threads: wait()
// observes the exit without reaping, then reaps under the same lock terminate()
// takes, so a recycled pid is never signaled. Destroying a process that has not
// been reaped kills and reaps it.
class process : uncopyable {
 public:
  process(process &&) noexcept;
  process &operator=(process &&) noexcept;
  ~process();

  pid_t pid() const;

  // Read end of a piped stream; an empty fd_cleanup if the stream was not piped or
  // has already been taken. Ownership moves to the caller.
  fd_cleanup take_stream(output_stream stream);

  // Blocks until the child exits. Throws process_wait_error if waiting fails.
  exit_status wait();

  // SIGKILL to the child's process group; no-op once the child has been reaped.
  void terminate();

  bool reaped() const;

 private:
  struct impl;
  explicit process(std::unique_ptr<impl> impl);
  void finalize() noexcept;

  friend process process_spawn(std::vector<std::string> const &argv,
                               launch_cfg const &cfg);

  std::unique_ptr<impl> impl_;
};

// Spawns argv[0] (PATH lookup applies) with argv. Throws launch_error when pipes
// cannot be created, fork fails, the working directory cannot be entered, or exec
// fails; in every case no child is left behind.
process process_spawn(std::vector<std::string> const &argv, launch_cfg const &cfg = {});

// argv is `executable inline_flag command extra_args...`, each a separate argument.
// With bash, extra_args land in $0, $1, ... of the inline command.
process process_launch(shell_binding const &binding,
                       std::string_view command,
                       std::vector<std::string> const &extra_args,
                       launch_cfg const &cfg = {});

}  // namespace cmdex
