#if defined(_WIN32)
#error "process_posix.cpp should not be compiled on Windows builds"
#else

#include "process.h"

#include "trace.h"
#include "tui.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cmdex {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };

// What the child reports through the status pipe when it cannot reach exec.
enum class child_stage : int { redirect = 1, chdir = 2, exec = 3 };

struct child_failure {
  child_stage stage;
  int error;
};

char const *child_stage_name(child_stage stage) {
  switch (stage) {
    case child_stage::redirect: return "stdio redirection failed";
    case child_stage::chdir: return "chdir failed";
    case child_stage::exec: return "exec failed";
  }
  return "child setup failed";
}

struct pipe_pair {
  fd_cleanup read_end;
  fd_cleanup write_end;
};

pipe_pair make_pipe() {
  int fds[2];
#if defined(__linux__)
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    throw launch_error(std::error_code{ errno, std::generic_category() }, "pipe failed");
  }
#else
  if (::pipe(fds) == -1) {
    throw launch_error(std::error_code{ errno, std::generic_category() }, "pipe failed");
  }
  std::ignore = ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  std::ignore = ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
  return { fd_cleanup{ fds[0] }, fd_cleanup{ fds[1] } };
}

exit_status decode_status(int status) {
  if (WIFEXITED(status)) { return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt }; }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

int reap(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result{ ::waitpid(child, &status, 0) };
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw process_wait_error("waitpid failed: " + std::string{ std::strerror(errno) },
                               std::nullopt);
    }
    return status;
  }
}

// Only async-signal-safe calls from here on; the parent may be multithreaded.
[[noreturn]] void report_and_exit(int status_fd, child_stage stage) {
  child_failure const failure{ .stage = stage, .error = errno };
  std::ignore = ::write(status_fd, &failure, sizeof failure);
  _exit(kChildErrorExit);
}

[[noreturn]] void exec_child_process(std::array<int, 3> const &stdio_targets,
                                     int status_fd,
                                     char const *cwd,
                                     std::vector<char *> const &argv) {
  ::setpgid(0, 0);

  for (int target_fd{ 0 }; target_fd < 3; ++target_fd) {
    int const src{ stdio_targets[static_cast<size_t>(target_fd)] };
    if (src == -1) { continue; }  // inherit
    if (::dup2(src, target_fd) == -1) { report_and_exit(status_fd, child_stage::redirect); }
  }

  if (cwd && ::chdir(cwd) == -1) { report_and_exit(status_fd, child_stage::chdir); }

  ::execvp(argv[0], argv.data());
  report_and_exit(status_fd, child_stage::exec);
}

}  // namespace

std::string_view output_stream_name(output_stream stream) {
  return stream == output_stream::std_out ? "stdout" : "stderr";
}

struct process::impl {
  pid_t pid{ -1 };
  fd_cleanup stdout_read;
  fd_cleanup stderr_read;
  mutable std::mutex reap_mutex;  // guards reaped/status against terminate()
  bool reaped{ false };
  std::optional<exit_status> status;
};

process::process(std::unique_ptr<impl> impl) : impl_{ std::move(impl) } {}

process::process(process &&) noexcept = default;

process &process::operator=(process &&other) noexcept {
  if (this == &other) { return *this; }
  finalize();
  impl_ = std::move(other.impl_);
  return *this;
}

process::~process() { finalize(); }

void process::finalize() noexcept {
  if (!impl_) { return; }
  try {
    if (!reaped()) {
      terminate();
      wait();
    }
  } catch (std::exception const &ex) {
    tui::warn("failed to reap child %d: %s", static_cast<int>(impl_->pid), ex.what());
  }
}

pid_t process::pid() const { return impl_->pid; }

fd_cleanup process::take_stream(output_stream stream) {
  return std::move(stream == output_stream::std_out ? impl_->stdout_read
                                                     : impl_->stderr_read);
}

bool process::reaped() const {
  std::lock_guard<std::mutex> lock{ impl_->reap_mutex };
  return impl_->reaped;
}

exit_status process::wait() {
  {
    std::lock_guard<std::mutex> lock{ impl_->reap_mutex };
    if (impl_->reaped) { return *impl_->status; }
  }

  siginfo_t info{};
  while (::waitid(P_PID, static_cast<id_t>(impl_->pid), &info, WEXITED | WNOWAIT) == -1) {
    if (errno == EINTR) { continue; }
    if (errno == ECHILD) { break; }  // reaped by a concurrent wait()
    throw process_wait_error("waitid failed: " + std::string{ std::strerror(errno) },
                             std::nullopt);
  }

  std::lock_guard<std::mutex> lock{ impl_->reap_mutex };
  if (!impl_->reaped) {
    impl_->status = decode_status(reap(impl_->pid));
    impl_->reaped = true;
  }
  return *impl_->status;
}

void process::terminate() {
  std::lock_guard<std::mutex> lock{ impl_->reap_mutex };
  if (impl_->reaped) { return; }

  // The child may not have reached setpgid yet; fall back to the pid itself.
  if (::kill(-impl_->pid, SIGKILL) == -1) { std::ignore = ::kill(impl_->pid, SIGKILL); }
}

process process_spawn(std::vector<std::string> const &argv_strings, launch_cfg const &cfg) {
  if (argv_strings.empty()) {
    throw launch_error(std::make_error_code(std::errc::invalid_argument),
                       "process_spawn: argv must be non-empty");
  }
  if (cfg.std_in == stdio_mode::pipe) {
    throw launch_error(std::make_error_code(std::errc::invalid_argument),
                       "process_spawn: stdin cannot be piped");
  }

  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto const &arg : argv_strings) { argv.push_back(const_cast<char *>(arg.c_str())); }
  argv.push_back(nullptr);

  std::string const cwd_storage{ cfg.cwd ? cfg.cwd->string() : std::string{} };
  char const *cwd{ cfg.cwd ? cwd_storage.c_str() : nullptr };

  std::optional<pipe_pair> stdout_pipe;
  std::optional<pipe_pair> stderr_pipe;
  if (cfg.std_out == stdio_mode::pipe) { stdout_pipe = make_pipe(); }
  if (cfg.std_err == stdio_mode::pipe) { stderr_pipe = make_pipe(); }

  fd_cleanup null_fd;
  bool const needs_null{ cfg.std_in == stdio_mode::null || cfg.std_out == stdio_mode::null ||
                         cfg.std_err == stdio_mode::null };
  if (needs_null) {
    null_fd = fd_cleanup{ ::open("/dev/null", O_RDWR | O_CLOEXEC) };
    if (!null_fd) {
      throw launch_error(std::error_code{ errno, std::generic_category() },
                         "open /dev/null failed");
    }
  }

  auto const target_for{ [&](stdio_mode mode, std::optional<pipe_pair> const &p) {
    switch (mode) {
      case stdio_mode::pipe: return p->write_end.get();
      case stdio_mode::null: return null_fd.get();
      case stdio_mode::inherit: return -1;
    }
    return -1;
  } };

  std::array<int, 3> const stdio_targets{
    cfg.std_in == stdio_mode::null ? null_fd.get() : -1,
    target_for(cfg.std_out, stdout_pipe),
    target_for(cfg.std_err, stderr_pipe),
  };

  pipe_pair status_pipe{ make_pipe() };

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw launch_error(std::error_code{ errno, std::generic_category() }, "fork failed");
  }

  if (child == 0) {  // child process exits in exec_child_process
    exec_child_process(stdio_targets, status_pipe.write_end.get(), cwd, argv);
  }

  // Parent: drop the child's ends so EOF arrives when the child exits.
  status_pipe.write_end.release();
  if (stdout_pipe) { stdout_pipe->write_end.release(); }
  if (stderr_pipe) { stderr_pipe->write_end.release(); }
  null_fd.release();

  child_failure failure{};
  ssize_t read_bytes{ -1 };
  do {
    read_bytes = ::read(status_pipe.read_end.get(), &failure, sizeof failure);
  } while (read_bytes == -1 && errno == EINTR);

  if (read_bytes != 0) {
    std::ignore = reap(child);
    int const err{ read_bytes == static_cast<ssize_t>(sizeof failure) ? failure.error
                                                                       : EIO };
    std::string what{ read_bytes == static_cast<ssize_t>(sizeof failure)
                          ? child_stage_name(failure.stage)
                          : "child status pipe failed" };
    what += ": ";
    what += argv_strings[0];
    if (cfg.cwd && failure.stage == child_stage::chdir) { what += " (cwd " + cwd_storage + ")"; }
    throw launch_error(std::error_code{ err, std::generic_category() }, what);
  }

  auto state{ std::make_unique<process::impl>() };
  state->pid = child;
  if (stdout_pipe) { state->stdout_read = std::move(stdout_pipe->read_end); }
  if (stderr_pipe) { state->stderr_read = std::move(stderr_pipe->read_end); }
  return process{ std::move(state) };
}

process process_launch(shell_binding const &binding,
                       std::string_view command,
                       std::vector<std::string> const &extra_args,
                       launch_cfg const &cfg) {
  std::vector<std::string> argv{ binding.executable, binding.inline_flag, std::string{ command } };
  argv.insert(argv.end(), extra_args.begin(), extra_args.end());

  try {
    process child{ process_spawn(argv, cfg) };
    CMDEX_TRACE_PROCESS_SPAWNED(child.pid(),
                                binding.executable,
                                util_join_args(command, extra_args));
    return child;
  } catch (launch_error const &ex) {
    CMDEX_TRACE_LAUNCH_FAILED(binding.executable,
                              util_join_args(command, extra_args),
                              std::string{ ex.what() });
    tui::debug("launch failed: %s", ex.what());
    throw;
  }
}

}  // namespace cmdex

#endif  // POSIX implementation
