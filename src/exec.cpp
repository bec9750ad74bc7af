#include "exec.h"

#include "channel.h"
#include "trace.h"
#include "tui.h"

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace cmdex {

namespace {

constexpr std::size_t kReadChunkSize{ 4096 };

void mirror_bytes(int fd, char const *data, size_t size) {
  while (size > 0) {
    ssize_t const written{ ::write(fd, data, size) };
    if (written == -1) {
      if (errno == EINTR) { continue; }
      return;
    }
    size -= static_cast<size_t>(written);
    data += written;
  }
}

struct cancel_pipe {
  fd_cleanup read_end;
  fd_cleanup write_end;
};

cancel_pipe make_cancel_pipe() {
  int fds[2];
#if defined(__linux__)
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    throw launch_error(std::error_code{ errno, std::generic_category() }, "cancel pipe failed");
  }
#else
  if (::pipe(fds) == -1) {
    throw launch_error(std::error_code{ errno, std::generic_category() }, "cancel pipe failed");
  }
  std::ignore = ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  std::ignore = ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
  return { fd_cleanup{ fds[0] }, fd_cleanup{ fds[1] } };
}

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

void exec_fault::raise(bool is_stderr) const {
  if (kind == fault_kind::stream_read) { throw stream_read_error(code, message, is_stderr); }
  throw process_wait_error(message, status);
}

struct async_execution::session {
  session(process p, cancel_pipe cancel, bool mirror)
      : child{ std::move(p) },
        cancel_read{ std::move(cancel.read_end) },
        cancel_write{ std::move(cancel.write_end) },
        mirror_stderr{ mirror } {}

  process child;
  // Readable once cancellation is requested. Never drained, so every reader sees it.
  fd_cleanup cancel_read;
  fd_cleanup cancel_write;
  std::atomic_bool cancel_requested{ false };
  channel<output_event> events{ kChannelCapacity };
  std::atomic<std::int64_t> events_sent{ 0 };
  bool const mirror_stderr;
  std::chrono::steady_clock::time_point const start{ std::chrono::steady_clock::now() };

  std::thread stdout_reader;
  std::thread stderr_reader;
  std::thread coordinator;

  void send(output_event ev) {
    if (events.send(std::move(ev))) { ++events_sent; }
  }

  void request_cancel();
  void decode(fd_cleanup fd, output_stream stream);
  void coordinate();
};

// Kills the child and wakes both readers. The wakeup does not depend on the
// child: a reaped shell may leave a background job holding the pipes open.
void async_execution::session::request_cancel() {
  child.terminate();
  if (cancel_requested.exchange(true)) { return; }

  char const wake{ 1 };
  while (::write(cancel_write.get(), &wake, 1) == -1) {
    if (errno == EINTR) { continue; }
    tui::warn("failed to signal cancellation for child %d: %s",
              static_cast<int>(child.pid()),
              std::strerror(errno));
    return;
  }
}

// One decode path. Every '\n' ends a line; a trailing unterminated line is
// flushed at end-of-stream, just before the terminal fault. A cancellation
// request ends the stream with an operation_canceled fault instead.
void async_execution::session::decode(fd_cleanup fd, output_stream stream) {
  bool const is_stderr{ stream == output_stream::std_err };
  std::string pending;
  std::array<char, kReadChunkSize> chunk{};
  std::int64_t lines{ 0 };

  std::string const stream_name{ output_stream_name(stream) };

  auto const emit_line{ [&](std::string line) {
    send(output_event{ .line = std::move(line), .fault = std::nullopt, .is_stderr = is_stderr });
    ++lines;
  } };

  auto const emit_fault{ [&](std::error_code ec, std::string message) {
    CMDEX_TRACE_STREAM_CLOSED(child.pid(), stream_name, lines, !ec);
    send(output_event{ .line = {},
                       .fault = exec_fault{ .kind = fault_kind::stream_read,
                                            .code = ec,
                                            .message = std::move(message),
                                            .status = std::nullopt },
                       .is_stderr = is_stderr });
  } };

  std::array<pollfd, 2> poll_fds{};
  poll_fds[0].fd = fd.get();
  poll_fds[0].events = POLLIN;
  poll_fds[1].fd = cancel_read.get();
  poll_fds[1].events = POLLIN;

  while (true) {
    if (::poll(poll_fds.data(), poll_fds.size(), -1) == -1) {
      if (errno == EINTR) { continue; }
      std::error_code const ec{ errno, std::generic_category() };
      emit_fault(ec, stream_name + " poll failed: " + ec.message());
      return;
    }

    if (poll_fds[1].revents != 0) {
      emit_fault(std::make_error_code(std::errc::operation_canceled),
                 stream_name + ": cancelled");
      return;
    }

    if (poll_fds[0].revents == 0) { continue; }

    ssize_t const read_bytes{ ::read(fd.get(), chunk.data(), chunk.size()) };

    if (read_bytes == -1) {
      if (errno == EINTR) { continue; }
      std::error_code const ec{ errno, std::generic_category() };
      emit_fault(ec, stream_name + " read failed: " + ec.message());
      return;
    }

    if (read_bytes == 0) {
      if (!pending.empty()) { emit_line(std::move(pending)); }
      emit_fault({}, stream_name + ": end of stream");
      return;
    }

    if (is_stderr && mirror_stderr) {
      mirror_bytes(STDERR_FILENO, chunk.data(), static_cast<size_t>(read_bytes));
    }

    pending.append(chunk.data(), static_cast<size_t>(read_bytes));

    size_t offset{ 0 };
    size_t newline{ 0 };
    while ((newline = pending.find('\n', offset)) != std::string::npos) {
      emit_line(pending.substr(offset, newline - offset));
      offset = newline + 1;
    }
    pending.erase(0, offset);
  }
}

// Waits for the child, reports an unsuccessful exit, then closes the channel once
// both decode paths have returned. This is the only place the channel is closed.
void async_execution::session::coordinate() {
  std::optional<exec_fault> exit_fault;

  try {
    exit_status const status{ child.wait() };
    CMDEX_TRACE_PROCESS_EXITED(child.pid(),
                               status.exit_code,
                               status.signal.value_or(0),
                               elapsed_ms(start));
    if (!status.success()) {
      exit_fault = exec_fault{ .kind = fault_kind::process_wait,
                               .code = {},
                               .message = "command failed: " + exit_status_describe(status),
                               .status = status };
    }
  } catch (process_wait_error const &ex) {
    child.terminate();  // unblock the readers
    exit_fault = exec_fault{ .kind = fault_kind::process_wait,
                             .code = {},
                             .message = ex.what(),
                             .status = std::nullopt };
  }

  if (exit_fault) {
    send(output_event{ .line = {}, .fault = std::move(exit_fault), .is_stderr = false });
  }

  stdout_reader.join();
  stderr_reader.join();

  events.close();
  CMDEX_TRACE_CHANNEL_CLOSED(child.pid(), events_sent.load(), events.receiver_detached());
}

async_execution::async_execution(std::unique_ptr<session> state)
    : state_{ std::move(state) } {}

async_execution::async_execution(async_execution &&) noexcept = default;

async_execution::~async_execution() {
  if (!state_) { return; }

  if (!state_->events.closed()) {
    state_->request_cancel();
    state_->events.detach_receiver();
  }

  if (state_->coordinator.joinable()) { state_->coordinator.join(); }
}

std::optional<output_event> async_execution::next() {
  if (!state_) { return std::nullopt; }
  return state_->events.receive();
}

void async_execution::cancel() {
  if (state_) { state_->request_cancel(); }
}

pid_t async_execution::pid() const { return state_ ? state_->child.pid() : -1; }

bool async_execution::finished() const { return !state_ || state_->events.closed(); }

async_execution::iterator::iterator(async_execution *owner)
    : owner_{ owner }, current_{ owner->next() } {}

async_execution::iterator &async_execution::iterator::operator++() {
  current_ = owner_->next();
  return *this;
}

executor::executor(shell_kind kind) : binding_{ shell_resolve(kind) } {}

executor::executor(shell_binding binding) : binding_{ std::move(binding) } {}

async_execution executor::async_execute(std::string_view command,
                                        std::vector<std::string> extra_args) const {
  launch_cfg const cfg{ .std_in = debug_ ? stdio_mode::inherit : stdio_mode::null,
                        .std_out = stdio_mode::pipe,
                        .std_err = stdio_mode::pipe,
                        .cwd = cwd_ };

  cancel_pipe cancel{ make_cancel_pipe() };
  auto state{ std::make_unique<async_execution::session>(
      process_launch(binding_, command, extra_args, cfg),
      std::move(cancel),
      debug_) };

  fd_cleanup stdout_fd{ state->child.take_stream(output_stream::std_out) };
  fd_cleanup stderr_fd{ state->child.take_stream(output_stream::std_err) };

  auto *s{ state.get() };
  try {
    s->stdout_reader = std::thread{ [s, fd = std::move(stdout_fd)]() mutable {
      s->decode(std::move(fd), output_stream::std_out);
    } };
    s->stderr_reader = std::thread{ [s, fd = std::move(stderr_fd)]() mutable {
      s->decode(std::move(fd), output_stream::std_err);
    } };
    s->coordinator = std::thread{ [s] { s->coordinate(); } };
  } catch (std::system_error const &ex) {
    // Thread creation failed: stop the child and wake any reader already started.
    s->request_cancel();
    s->events.detach_receiver();
    if (s->stdout_reader.joinable()) { s->stdout_reader.join(); }
    if (s->stderr_reader.joinable()) { s->stderr_reader.join(); }
    throw launch_error(ex.code(), std::string{ "failed to start reader threads: " } + ex.what());
  }

  return async_execution{ std::move(state) };
}

std::string executor::execute(std::string_view command,
                              std::vector<std::string> const &extra_args) const {
  launch_cfg const cfg{ .std_in = debug_ ? stdio_mode::inherit : stdio_mode::null,
                        .std_out = stdio_mode::pipe,
                        .std_err = debug_ ? stdio_mode::inherit : stdio_mode::pipe,
                        .cwd = cwd_ };

  process child{ process_launch(binding_, command, extra_args, cfg) };

  struct pipe_state {
    fd_cleanup read_fd;
    std::string data;
    bool closed;
  };

  std::array<pipe_state, 2> pipes{
    pipe_state{ child.take_stream(output_stream::std_out), {}, false },
    pipe_state{ child.take_stream(output_stream::std_err), {}, false },
  };

  std::array<pollfd, 2> poll_fds{};
  size_t closed_count{ 0 };
  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    if (!pipes[i].read_fd) {
      pipes[i].closed = true;
      ++closed_count;
    }
    poll_fds[i].fd = pipes[i].closed ? -1 : pipes[i].read_fd.get();
    poll_fds[i].events = pipes[i].closed ? 0 : POLLIN;
  }

  std::array<char, kReadChunkSize> chunk{};
  while (closed_count < pipes.size()) {
    int const poll_result{ ::poll(poll_fds.data(), poll_fds.size(), -1) };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw process_wait_error("poll failed: " + std::string{ std::strerror(errno) },
                               std::nullopt,
                               std::move(pipes[0].data));
    }

    for (size_t i{ 0 }; i < pipes.size(); ++i) {
      if (pipes[i].closed || poll_fds[i].revents == 0) { continue; }

      ssize_t const read_bytes{ ::read(pipes[i].read_fd.get(), chunk.data(), chunk.size()) };
      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw stream_read_error(std::error_code{ errno, std::generic_category() },
                                std::string{ output_stream_name(static_cast<output_stream>(i)) } +
                                    " read failed",
                                i == 1);
      }

      if (read_bytes == 0) {
        pipes[i].closed = true;
        ++closed_count;
        poll_fds[i].fd = -1;
        poll_fds[i].events = 0;
        continue;
      }

      pipes[i].data.append(chunk.data(), static_cast<size_t>(read_bytes));
    }
  }

  exit_status const status{ child.wait() };
  if (!status.success()) {
    std::string const description{ exit_status_describe(status) };
    tui::warn("Couldn't run command << %s >>: %s",
              util_join_args(command, extra_args).c_str(),
              description.c_str());
    throw process_wait_error("command failed: " + description,
                             status,
                             std::move(pipes[0].data),
                             std::move(pipes[1].data));
  }

  return std::move(pipes[0].data);
}

void executor::clear_console() const {
  std::vector<std::string> const argv = shell_is_windows(binding_)
                                            ? std::vector<std::string>{ "cmd.exe", "/c", "cls" }
                                            : std::vector<std::string>{ "clear" };

  process child{ process_spawn(argv, { .std_in = stdio_mode::inherit,
                                       .std_out = stdio_mode::inherit,
                                       .std_err = stdio_mode::inherit,
                                       .cwd = std::nullopt }) };

  exit_status const status{ child.wait() };
  if (!status.success()) {
    throw process_wait_error("clear console failed: " + exit_status_describe(status), status);
  }
}

}  // namespace cmdex
